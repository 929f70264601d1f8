#pragma once

#include "Saekim/Convert/ValueConverters.h"
#include "Saekim/Mapping/ControlMappings.h"
#include "Saekim/Mapping/FrameworkAliases.h"
#include "Saekim/Public/ExportTypes.h"
#include <vector>

namespace Saekim::Normalize
{
    struct FlatNode
    {
        const SceneNode* node = nullptr;
        juce::String path;
    };

    // Visible layers first (layer order, then node order), then root-level nodes.
    std::vector<FlatNode> flattenScene(const SceneModel& scene);

    class TreeNormalizer
    {
    public:
        TreeNormalizer(const Mapping::MappingRegistry& mappingsIn,
                       const Mapping::FrameworkAliasRegistry& aliasesIn,
                       const Convert::ValueConverterSet& convertersIn,
                       ExportOptions optionsIn);

        // Fails only on structural problems (nesting deeper than kMaxTreeDepth).
        // Everything else is recorded in reportOut and exported best-effort.
        juce::Result normalize(const SceneModel& scene,
                               std::vector<CanonicalNode>& nodesOut,
                               ExportReport& reportOut) const;

    private:
        struct Pass;
        struct Resolution;

        Resolution resolve(const SceneNode& source) const;

        juce::Result normalizeNode(const SceneNode& source,
                                   int depth,
                                   const juce::String& rootPath,
                                   Pass& pass,
                                   CanonicalNode& nodeOut) const;

        void applyRule(const Mapping::PropertyRule& rule,
                       const juce::var& value,
                       const juce::String& label,
                       Pass& pass,
                       CanonicalNode& nodeOut) const;

        void applyMappedProperties(const SceneNode& source,
                                   const Mapping::ControlMapping& mapping,
                                   const juce::String& label,
                                   Pass& pass,
                                   CanonicalNode& nodeOut) const;

        void applyGenericProperties(const SceneNode& source,
                                    const juce::String& label,
                                    Pass& pass,
                                    CanonicalNode& nodeOut) const;

        void applyStandardProperties(const SceneNode& source,
                                     const juce::String& label,
                                     Pass& pass,
                                     CanonicalNode& nodeOut) const;

        void applyAttachedProperties(const SceneNode& source,
                                     const juce::String& label,
                                     Pass& pass,
                                     CanonicalNode& nodeOut) const;

        void dropUnhonouredAttachedProperties(const Mapping::ControlMapping& parent,
                                              const juce::String& childLabel,
                                              Pass& pass,
                                              CanonicalNode& child) const;

        const Mapping::MappingRegistry& mappings;
        const Mapping::FrameworkAliasRegistry& aliases;
        const Convert::ValueConverterSet& converters;
        ExportOptions options;
        Convert::ConvertOptions convertOptions;
    };
}
