#pragma once

#include "Saekim/Convert/ValueConverters.h"
#include "Saekim/Mapping/ControlMappings.h"
#include "Saekim/Mapping/FrameworkAliases.h"
#include "Saekim/Public/ExportTypes.h"

namespace Saekim::Export
{
    // Runs configuring -> normalizing -> generating -> assembling -> done | failed.
    // Never throws; every failure ends up in ExportResult::error.
    class ExportOrchestrator
    {
    public:
        explicit ExportOrchestrator(ExportOptions defaultsIn = {});

        // The registries are referenced, not copied, and must outlive the orchestrator.
        ExportOrchestrator(const Mapping::MappingRegistry& mappingsIn,
                           const Mapping::FrameworkAliasRegistry& aliasesIn,
                           const Convert::ValueConverterSet& convertersIn,
                           ExportOptions defaultsIn = {});

        ExportOrchestrator(Mapping::MappingRegistry&&,
                           const Mapping::FrameworkAliasRegistry&,
                           const Convert::ValueConverterSet&,
                           ExportOptions = {}) = delete;
        ExportOrchestrator(const Mapping::MappingRegistry&,
                           Mapping::FrameworkAliasRegistry&&,
                           const Convert::ValueConverterSet&,
                           ExportOptions = {}) = delete;
        ExportOrchestrator(const Mapping::MappingRegistry&,
                           const Mapping::FrameworkAliasRegistry&,
                           Convert::ValueConverterSet&&,
                           ExportOptions = {}) = delete;

        ExportResult exportScene(const SceneModel& scene) const;
        ExportResult exportScene(const SceneModel& scene, const ExportOptions& options) const;

        // Scene and option overrides as parsed JSON. Overrides are merged onto the defaults.
        ExportResult exportSceneJson(const juce::var& sceneVar, const juce::var& optionOverrides = {}) const;

        juce::Result preview(const SceneModel& scene, ExportPreview& previewOut) const;
        juce::Result preview(const SceneModel& scene, const ExportOptions& options, ExportPreview& previewOut) const;

        const ExportOptions& defaults() const noexcept { return defaultOptions; }
        void setDefaults(ExportOptions newDefaults) { defaultOptions = std::move(newDefaults); }

    private:
        const Mapping::MappingRegistry& mappings;
        const Mapping::FrameworkAliasRegistry& aliases;
        const Convert::ValueConverterSet& converters;
        ExportOptions defaultOptions;
    };
}
