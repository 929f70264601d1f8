#include "Saekim/Export/ExportOrchestrator.h"

#include "Saekim/Companion/CompanionSourceGenerator.h"
#include "Saekim/Companion/ProjectScaffold.h"
#include "Saekim/Markup/MarkupGenerator.h"
#include "Saekim/Normalize/TreeNormalizer.h"
#include "Saekim/Serialization/OptionsJson.h"
#include "Saekim/Serialization/SceneJson.h"
#include "Saekim/Theme/StyleGenerator.h"
#include <exception>

namespace
{
    void enterStage(Saekim::ExportResult& result, Saekim::ExportStage stage)
    {
        DBG("[Saekim] export stage " + Saekim::exportStageToKey(result.stage)
            + " -> " + Saekim::exportStageToKey(stage));
        result.stage = stage;
    }

    void collectUnsupportedTypes(const std::vector<Saekim::CanonicalNode>& nodes, juce::StringArray& typesOut)
    {
        for (const auto& node : nodes)
        {
            if (!node.supported)
                typesOut.addIfNotAlreadyThere(node.sourceType);

            collectUnsupportedTypes(node.children, typesOut);
        }
    }

    int countGeneratedFiles(const Saekim::ExportOptions& options) noexcept
    {
        return 1
             + (options.includeCodeBehind ? 1 : 0)
             + (options.includeViewModel ? 1 : 0)
             + (options.generateTheme ? 1 : 0);
    }
}

namespace Saekim::Export
{
    ExportOrchestrator::ExportOrchestrator(ExportOptions defaultsIn)
        : ExportOrchestrator(Mapping::defaultMappingRegistry(),
                             Mapping::defaultFrameworkAliasRegistry(),
                             Convert::defaultValueConverterSet(),
                             std::move(defaultsIn))
    {
    }

    ExportOrchestrator::ExportOrchestrator(const Mapping::MappingRegistry& mappingsIn,
                                           const Mapping::FrameworkAliasRegistry& aliasesIn,
                                           const Convert::ValueConverterSet& convertersIn,
                                           ExportOptions defaultsIn)
        : mappings(mappingsIn),
          aliases(aliasesIn),
          converters(convertersIn),
          defaultOptions(std::move(defaultsIn))
    {
    }

    ExportResult ExportOrchestrator::exportScene(const SceneModel& scene) const
    {
        return exportScene(scene, defaultOptions);
    }

    ExportResult ExportOrchestrator::exportScene(const SceneModel& scene, const ExportOptions& requestedOptions) const
    {
        ExportResult result;
        auto& report = result.report;

        const auto fail = [&result](const juce::String& message) -> ExportResult
        {
            DBG("[Saekim] export failed: " + message);
            result.success = false;
            result.stage = ExportStage::failed;
            result.files.clear();
            result.primaryFileName.clear();
            result.primaryContent.clear();
            result.error = message;
            result.report.fileCount = 0;
            result.report.addIssue(IssueSeverity::error, message);
            return result;
        };

        try
        {
            juce::StringArray adjustments;
            const auto options = requestedOptions.sanitised(&adjustments);
            for (const auto& adjustment : adjustments)
                report.addIssue(IssueSeverity::info, adjustment);

            report.className = options.className;
            report.rootElement = rootKindToElement(options.rootKind);
            report.rootNamespace = options.rootNamespace;

            enterStage(result, ExportStage::normalizing);

            std::vector<CanonicalNode> nodes;
            Normalize::TreeNormalizer normalizer(mappings, aliases, converters, options);
            const auto normalized = normalizer.normalize(scene, nodes, report);
            if (normalized.failed())
                return fail(normalized.getErrorMessage());

            enterStage(result, ExportStage::generating);

            const Markup::MarkupGenerator markupGenerator(options);
            const auto markup = markupGenerator.generateDocument(nodes, Markup::makeDocumentInfo(scene));
            const auto markupFileName = options.className + ".axaml";

            std::vector<ExportedFile> files;
            files.push_back({ markupFileName, markup, FileKind::markup });

            const Companion::CompanionSourceGenerator companionGenerator(options);
            if (options.includeCodeBehind)
            {
                files.push_back({ markupFileName + ".cs",
                                  companionGenerator.generateCompanionSource(nodes, options.className, options.rootKind),
                                  FileKind::source });
            }

            if (options.includeViewModel)
            {
                files.push_back({ options.viewModelClassName() + ".cs",
                                  companionGenerator.generateViewModelSource(nodes, options.className),
                                  FileKind::source });
            }

            if (options.generateTheme)
            {
                auto palette = Theme::ThemePalette::makeDefault();
                juce::StringArray rejected;
                palette.applyOverrides(options.paletteOverrides, rejected);
                for (const auto& key : rejected)
                    report.addIssue(IssueSeverity::warning, "Palette override '" + key + "' ignored");

                const Theme::StyleGenerator styleGenerator(std::move(palette), options);
                files.push_back({ options.themeFileName(),
                                  styleGenerator.generateTheme(Theme::collectStyleTargets(nodes)),
                                  FileKind::theme });
            }

            enterStage(result, ExportStage::assembling);

            if (options.preset == ExportPreset::project)
            {
                for (auto& file : Companion::generateProjectScaffold(options))
                    files.push_back(std::move(file));
            }

            result.files = std::move(files);
        }
        catch (const std::exception& e)
        {
            return fail("Export threw during " + exportStageToKey(result.stage) + ": " + juce::String(e.what()));
        }

        result.primaryFileName = result.files.front().fileName;
        result.primaryContent = result.files.front().content;
        report.fileCount = static_cast<int>(result.files.size());
        result.success = true;
        enterStage(result, ExportStage::done);
        return result;
    }

    ExportResult ExportOrchestrator::exportSceneJson(const juce::var& sceneVar, const juce::var& optionOverrides) const
    {
        auto options = defaultOptions;
        juce::StringArray ignoredKeys;

        if (!optionOverrides.isVoid())
        {
            const auto merged = Serialization::applyOptionOverrides(optionOverrides, options, &ignoredKeys);
            if (merged.failed())
            {
                ExportResult result;
                result.stage = ExportStage::failed;
                result.error = merged.getErrorMessage();
                result.report.addIssue(IssueSeverity::error, result.error);
                return result;
            }
        }

        SceneModel scene;
        const auto parsed = Serialization::parseScene(sceneVar, scene);
        if (parsed.failed())
        {
            ExportResult result;
            result.stage = ExportStage::failed;
            result.error = parsed.getErrorMessage();
            result.report.className = options.className;
            result.report.addIssue(IssueSeverity::error, result.error);
            return result;
        }

        auto result = exportScene(scene, options);
        for (const auto& key : ignoredKeys)
            result.report.addIssue(IssueSeverity::info, "Option '" + key + "' ignored");

        return result;
    }

    juce::Result ExportOrchestrator::preview(const SceneModel& scene, ExportPreview& previewOut) const
    {
        return preview(scene, defaultOptions, previewOut);
    }

    juce::Result ExportOrchestrator::preview(const SceneModel& scene,
                                             const ExportOptions& requestedOptions,
                                             ExportPreview& previewOut) const
    {
        const auto options = requestedOptions.sanitised();

        std::vector<CanonicalNode> nodes;
        ExportReport report;
        Normalize::TreeNormalizer normalizer(mappings, aliases, converters, options);
        const auto normalized = normalizer.normalize(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        ExportPreview preview;
        preview.componentCount = report.nodeCount;
        preview.supportedCount = report.supportedCount;
        collectUnsupportedTypes(nodes, preview.unsupportedTypes);
        preview.estimatedFileCount = countGeneratedFiles(options);
        preview.rootElement = rootKindToElement(options.rootKind);
        preview.rootNamespace = options.rootNamespace;
        preview.className = options.className;

        previewOut = std::move(preview);
        return juce::Result::ok();
    }
}
