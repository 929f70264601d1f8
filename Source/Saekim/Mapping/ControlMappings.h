#pragma once

#include "Saekim/Convert/ValueConverters.h"
#include <algorithm>
#include <vector>

namespace Saekim::Mapping
{
    struct PropertyRule
    {
        juce::String source;
        juce::String target;
        Convert::ConverterKind converter = Convert::ConverterKind::string;

        // Values that convert to the same text as this default are not emitted.
        // A void default means every present value is emitted.
        juce::var defaultValue;
    };

    struct ControlMapping
    {
        juce::String sourceType;
        juce::String targetElement;
        juce::String targetNamespace { "Avalonia.Controls" };
        std::vector<PropertyRule> rules;
        juce::String contentProperty;
        juce::String styleClass;

        // Attached properties a panel honours on its children. Children of a
        // declaring panel lose attached properties owned by any other panel.
        juce::StringArray attachedProperties;
        juce::StringPairArray fixedAttributes { false };
    };

    class MappingRegistry
    {
    public:
        bool registerMapping(ControlMapping mapping)
        {
            mapping.sourceType = mapping.sourceType.trim();
            mapping.targetElement = mapping.targetElement.trim();

            if (mapping.sourceType.isEmpty() || mapping.targetElement.isEmpty())
                return false;
            if (findBySourceType(mapping.sourceType) != nullptr)
                return false;

            for (const auto& rule : mapping.rules)
            {
                if (rule.source.trim().isEmpty() || rule.target.trim().isEmpty())
                    return false;
            }

            if (mapping.targetNamespace.trim().isEmpty())
                mapping.targetNamespace = "Avalonia.Controls";

            mappings.push_back(std::move(mapping));
            return true;
        }

        const ControlMapping* findBySourceType(const juce::String& sourceType) const noexcept
        {
            const auto it = std::find_if(mappings.begin(),
                                         mappings.end(),
                                         [&sourceType](const ControlMapping& mapping)
                                         {
                                             return mapping.sourceType == sourceType;
                                         });
            return it == mappings.end() ? nullptr : &(*it);
        }

        // First mapping in registration order wins when several share an element.
        const ControlMapping* findByTargetElement(const juce::String& targetElement) const noexcept
        {
            const auto it = std::find_if(mappings.begin(),
                                         mappings.end(),
                                         [&targetElement](const ControlMapping& mapping)
                                         {
                                             return mapping.targetElement == targetElement;
                                         });
            return it == mappings.end() ? nullptr : &(*it);
        }

        std::vector<const ControlMapping*> findByCategory(const juce::String& prefix) const
        {
            std::vector<const ControlMapping*> listed;
            for (const auto& mapping : mappings)
            {
                if (mapping.sourceType.startsWith(prefix))
                    listed.push_back(&mapping);
            }

            return listed;
        }

        const std::vector<ControlMapping>& all() const noexcept
        {
            return mappings;
        }

    private:
        std::vector<ControlMapping> mappings;
    };

    MappingRegistry makeDefaultMappingRegistry();
    const MappingRegistry& defaultMappingRegistry();
}
