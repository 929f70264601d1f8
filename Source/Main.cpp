#include <juce_core/juce_core.h>
#include "Saekim/Export/ExportOrchestrator.h"
#include "Saekim/Export/ExportPresets.h"
#include "Saekim/Export/ExportWriter.h"
#include "Saekim/Serialization/OptionsJson.h"
#include "Saekim/Serialization/SceneJson.h"
#include <iostream>

namespace
{
    bool hasArg(const juce::StringArray& args, const juce::String& key)
    {
        for (const auto& arg : args)
        {
            if (arg == key)
                return true;
        }

        return false;
    }

    juce::String argValue(const juce::StringArray& args, const juce::String& prefix)
    {
        for (const auto& arg : args)
        {
            if (arg.startsWith(prefix))
                return arg.fromFirstOccurrenceOf(prefix, false, false).unquoted();
        }

        return {};
    }

    juce::File resolvePath(const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }

    void printUsage()
    {
        std::cout << "saekim-export " << SAEKIM_VERSION << "\n"
                  << "usage: saekim-export --scene=<file.json> [--output-dir=<dir>] [--options=<file.json>]\n"
                  << "                     [--preset=document|window|usercontrol|project]\n"
                  << "                     [--class=<Name>] [--namespace=<NS>]\n"
                  << "                     [--preview] [--print] [--overwrite=false]" << std::endl;
    }

    juce::Result buildOptions(const juce::StringArray& args, Saekim::ExportOptions& optionsOut)
    {
        Saekim::ExportOptions options;

        const auto presetArg = argValue(args, "--preset=");
        if (presetArg.isNotEmpty())
        {
            const auto preset = Saekim::exportPresetFromKey(presetArg);
            if (!preset.has_value())
                return juce::Result::fail("Unknown preset: " + presetArg);
            options = Saekim::Export::withPreset(*preset, options);
        }

        const auto optionsArg = argValue(args, "--options=");
        if (optionsArg.isNotEmpty())
        {
            juce::StringArray ignoredKeys;
            const auto loaded = Saekim::Serialization::loadOptionsFromFile(resolvePath(optionsArg), options, &ignoredKeys);
            if (loaded.failed())
                return juce::Result::fail("Options: " + loaded.getErrorMessage());

            for (const auto& key : ignoredKeys)
                std::cerr << "Ignoring option: " << key << std::endl;
        }

        const auto classArg = argValue(args, "--class=");
        if (classArg.isNotEmpty())
            options.className = classArg;

        const auto namespaceArg = argValue(args, "--namespace=");
        if (namespaceArg.isNotEmpty())
            options.rootNamespace = namespaceArg;

        optionsOut = std::move(options);
        return juce::Result::ok();
    }

    void printPreview(const Saekim::ExportPreview& preview)
    {
        std::cout << "Root: " << preview.rootElement << " " << preview.rootNamespace << "." << preview.className << "\n"
                  << "Components: " << preview.componentCount << " (" << preview.supportedCount << " supported)\n"
                  << "Estimated files: " << preview.estimatedFileCount << std::endl;

        if (!preview.unsupportedTypes.isEmpty())
            std::cout << "Unsupported: " << preview.unsupportedTypes.joinIntoString(", ") << std::endl;
    }

    int run(const juce::StringArray& args)
    {
        if (args.isEmpty() || hasArg(args, "--help") || hasArg(args, "-h"))
        {
            printUsage();
            return args.isEmpty() ? 1 : 0;
        }

        const auto sceneArg = argValue(args, "--scene=");
        if (sceneArg.isEmpty())
        {
            std::cerr << "Missing --scene=<file.json>" << std::endl;
            printUsage();
            return 1;
        }

        Saekim::ExportOptions options;
        const auto optionsResult = buildOptions(args, options);
        if (optionsResult.failed())
        {
            std::cerr << optionsResult.getErrorMessage() << std::endl;
            return 1;
        }

        Saekim::SceneModel scene;
        const auto sceneResult = Saekim::Serialization::loadSceneFromFile(resolvePath(sceneArg), scene);
        if (sceneResult.failed())
        {
            std::cerr << "Scene: " << sceneResult.getErrorMessage() << std::endl;
            return 1;
        }

        const Saekim::Export::ExportOrchestrator orchestrator(options);

        if (hasArg(args, "--preview"))
        {
            Saekim::ExportPreview preview;
            const auto previewResult = orchestrator.preview(scene, preview);
            if (previewResult.failed())
            {
                std::cerr << "Preview failed: " << previewResult.getErrorMessage() << std::endl;
                return 1;
            }

            printPreview(preview);
            return 0;
        }

        const auto result = orchestrator.exportScene(scene);
        std::cout << result.report.toText() << std::endl;

        if (!result.success)
        {
            std::cerr << "Export failed: " << result.error << std::endl;
            return 1;
        }

        if (hasArg(args, "--print"))
        {
            for (const auto& file : result.files)
                std::cout << "==> " << file.fileName << " <==\n" << file.content << std::endl;
        }

        const auto outputArg = argValue(args, "--output-dir=");
        if (outputArg.isNotEmpty())
        {
            const auto overwrite = argValue(args, "--overwrite=").trim().toLowerCase() != "false";
            juce::Array<juce::File> written;
            const auto writeResult = Saekim::Export::writeExportedFiles(result, resolvePath(outputArg), overwrite, &written);
            if (writeResult.failed())
            {
                std::cerr << "Write failed: " << writeResult.getErrorMessage() << std::endl;
                return 1;
            }

            for (const auto& file : written)
                std::cout << "Wrote " << file.getFullPathName() << std::endl;
        }

        return 0;
    }
}

int main(int argc, char* argv[])
{
    juce::StringArray args;
    for (int i = 1; i < argc; ++i)
        args.add(juce::String::fromUTF8(argv[i]));

    args.trim();
    args.removeEmptyStrings();
    return run(args);
}
