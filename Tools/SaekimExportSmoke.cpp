#include <juce_core/juce_core.h>

#include "Saekim/Export/ExportOrchestrator.h"
#include "Saekim/Export/ExportPresets.h"
#include "Saekim/Export/ExportWriter.h"
#include "Saekim/Serialization/OptionsJson.h"
#include "Saekim/Serialization/SceneJson.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <iostream>
#include <vector>

namespace
{
    constexpr const char* kLoginSceneJson = R"({
        "title": "Login",
        "width": 640,
        "layers": [
            {
                "name": "Main",
                "nodes": [
                    {
                        "type": "layout-stackpanel",
                        "children": [
                            { "type": "ui-textbox", "name": "userBox", "properties": { "text": "{Binding UserName}" } },
                            { "type": "button", "name": "ok", "properties": { "text": "OK", "onClick": "OnOk" } }
                        ]
                    }
                ]
            },
            { "name": "Guides", "visible": false, "nodes": [ { "type": "ui-hologram" } ] }
        ]
    })";

    juce::var parseJson(const juce::String& text)
    {
        return juce::JSON::parse(text);
    }

    bool hasIssue(const Saekim::ExportReport& report, Saekim::IssueSeverity severity, const juce::String& fragment)
    {
        for (const auto& issue : report.issues)
        {
            if (issue.severity == severity && issue.message.contains(fragment))
                return true;
        }

        return false;
    }

    juce::Result loadLoginScene(Saekim::SceneModel& sceneOut)
    {
        return Saekim::Serialization::parseSceneText(kLoginSceneJson, sceneOut);
    }

    juce::File makeScratchDirectory()
    {
        return juce::File::getSpecialLocation(juce::File::tempDirectory)
            .getNonexistentChildFile("saekim-export-smoke", {}, false);
    }

    juce::Result testSceneJsonParsing()
    {
        Saekim::SceneModel scene;
        const auto parsed = loadLoginScene(scene);
        if (parsed.failed())
            return parsed;

        if (scene.title != "Login" || !scene.width.has_value() || *scene.width != 640.0 || scene.height.has_value())
            return juce::Result::fail("Scene header not parsed");

        if (scene.layers.size() != 2 || scene.layers[1].visible || scene.layers[0].nodes.size() != 1)
            return juce::Result::fail("Layers not parsed");

        const auto& panel = scene.layers[0].nodes[0];
        if (panel.children.size() != 2 || panel.children[1].name != "ok"
            || panel.children[1].properties["text"].toString() != "OK")
            return juce::Result::fail("Nested nodes not parsed");

        Saekim::SceneModel aliased;
        const auto aliasedResult = Saekim::Serialization::parseSceneText(R"({
            "objects": [ { "uiComponentType": "ui-slider", "uiProperties": { "value": 5 } },
                         { "avaloniaType": "CalendarDatePicker" } ],
            "resources": [ { "key": "Accent", "value": "#FF8800" } ]
        })", aliased);
        if (aliasedResult.failed())
            return aliasedResult;

        if (aliased.nodes.size() != 2 || aliased.nodes[0].type != "ui-slider"
            || static_cast<int>(aliased.nodes[0].properties["value"]) != 5
            || aliased.nodes[1].targetType != "CalendarDatePicker" || aliased.nodes[1].type != "CalendarDatePicker")
            return juce::Result::fail("Alternate key names not accepted");

        if (aliased.resources.size() != 1 || aliased.resources[0].key != "Accent")
            return juce::Result::fail("Resource array not parsed");

        return juce::Result::ok();
    }

    juce::Result testSceneJsonErrorsCarryPaths()
    {
        struct Case
        {
            const char* json;
            const char* expected;
        };

        const Case cases[] = {
            { R"({ "nodes": [ { "type": "button" }, { "properties": {} } ] })", "scene.nodes[1] requires type or targetType" },
            { R"({ "layers": [ { "nodes": [ { "type": "a", "children": [ { "type": "b", "x": "left" } ] } ] } ] })",
              "scene.layers[0].nodes[0].children[0].x must be numeric" },
            { R"({ "layers": [ { "visible": "no" } ] })", "scene.layers[0].visible must be bool" },
            { R"({ "nodes": { "type": "button" } })", "scene.nodes must be array" },
            { R"({ "nodes": [ { "type": "button", "properties": [ 1 ] } ] })", "scene.nodes[0].properties must be object" },
            { R"({ "resources": [ { "value": "#FFF" } ] })", "scene.resources[0] requires key" },
            { R"([ 1, 2 ])", "scene must be object" },
            { R"({ "nodes": [ )", "JSON parse error" }
        };

        for (const auto& check : cases)
        {
            Saekim::SceneModel scene;
            scene.title = "untouched";
            const auto result = Saekim::Serialization::parseSceneText(check.json, scene);
            if (result.wasOk())
                return juce::Result::fail("Accepted invalid scene: " + juce::String(check.json));

            if (!result.getErrorMessage().contains(check.expected))
                return juce::Result::fail("Expected '" + juce::String(check.expected) + "', got '" + result.getErrorMessage() + "'");

            if (scene.title != "untouched")
                return juce::Result::fail("Failed parse modified the output scene");
        }

        Saekim::SceneModel missing;
        const auto missingFile = Saekim::Serialization::loadSceneFromFile(juce::File("/nonexistent/saekim/scene.json"), missing);
        if (missingFile.wasOk() || !missingFile.getErrorMessage().startsWith("File not found"))
            return juce::Result::fail("Missing scene file should be reported");

        return juce::Result::ok();
    }

    juce::Result testOptionOverrides()
    {
        Saekim::ExportOptions options;
        juce::StringArray ignored;
        const auto applied = Saekim::Serialization::applyOptionOverrides(parseJson(R"({
            "generateTheme": false,
            "preset": "project",
            "viewModelIdiom": "reactive",
            "className": "Login",
            "indentSize": 2,
            "paletteOverrides": { "primary": "#FF0000" },
            "glowMode": true,
            "includeComments": "yes"
        })"), options, &ignored);

        if (applied.failed())
            return applied;

        if (options.preset != Saekim::ExportPreset::project || !options.includeCodeBehind || !options.includeViewModel)
            return juce::Result::fail("Preset was not applied");

        if (options.generateTheme)
            return juce::Result::fail("Explicit keys should override the preset regardless of order");

        if (options.viewModelIdiom != Saekim::ViewModelIdiom::reactiveUI || options.className != "Login"
            || options.indentSize != 2 || options.paletteOverrides["primary"] != "#FF0000" || !options.includeComments)
            return juce::Result::fail("Option values not applied");

        ignored.sort(false);
        if (ignored != juce::StringArray { "glowMode", "includeComments" })
            return juce::Result::fail("Unexpected ignored keys: " + ignored.joinIntoString(", "));

        const auto before = options.className;
        if (Saekim::Serialization::applyOptionOverrides(juce::var("window"), options).wasOk() || options.className != before)
            return juce::Result::fail("Non-object overrides should fail without changes");

        return juce::Result::ok();
    }

    juce::Result testPresetFileSets()
    {
        Saekim::SceneModel scene;
        const auto parsed = loadLoginScene(scene);
        if (parsed.failed())
            return parsed;

        const Saekim::Export::ExportOrchestrator orchestrator;

        const auto document = orchestrator.exportScene(scene);
        if (!document.success || document.files.size() != 1 || document.primaryFileName != "ExportedView.axaml"
            || document.files[0].kind != Saekim::FileKind::markup || document.report.fileCount != 1
            || document.stage != Saekim::ExportStage::done)
            return juce::Result::fail("Document preset should produce a single markup file");

        auto projectOptions = Saekim::Export::withPreset(Saekim::ExportPreset::project);
        projectOptions.className = "Login";
        projectOptions.rootNamespace = "Demo";

        const auto project = orchestrator.exportScene(scene, projectOptions);
        if (!project.success)
            return juce::Result::fail("Project export failed: " + project.error);

        const juce::StringArray leading { "Login.axaml", "Login.axaml.cs", "LoginViewModel.cs", "AsciiTheme.axaml" };
        if (project.files.size() != 12 || project.report.fileCount != 12)
            return juce::Result::fail("Project preset should produce 4 view files and 8 scaffold files");

        for (int i = 0; i < leading.size(); ++i)
        {
            if (project.files[static_cast<size_t>(i)].fileName != leading[i])
                return juce::Result::fail("Unexpected file order at " + juce::String(i) + ": " + project.files[static_cast<size_t>(i)].fileName);
        }

        if (project.findFile("Demo.csproj") == nullptr || project.findFile("Views/MainWindow.axaml") == nullptr)
            return juce::Result::fail("Scaffold files missing");

        if (!project.primaryContent.contains("Classes=\"AsciiButton\"")
            || !project.primaryContent.contains("x:Class=\"Demo.Login\""))
            return juce::Result::fail("Project markup should carry style classes:\n" + project.primaryContent);

        const auto* codeBehind = project.findFile("Login.axaml.cs");
        if (codeBehind == nullptr || !codeBehind->content.contains("private void OnOk(object? sender, RoutedEventArgs e)"))
            return juce::Result::fail("Code-behind handler missing");

        const auto* viewModel = project.findFile("LoginViewModel.cs");
        if (viewModel == nullptr || !viewModel->content.contains("public string UserName"))
            return juce::Result::fail("View model property missing");

        const auto* theme = project.findFile("AsciiTheme.axaml");
        if (theme == nullptr || theme->kind != Saekim::FileKind::theme || !theme->content.contains("Selector=\"TextBox.AsciiTextBox\""))
            return juce::Result::fail("Theme file missing or incomplete");

        const auto window = orchestrator.exportScene(scene, Saekim::Export::withPreset(Saekim::ExportPreset::window));
        if (!window.success || window.report.rootElement != "Window" || !window.primaryContent.contains("<Window\n")
            || !window.primaryContent.contains("Title=\"Login\""))
            return juce::Result::fail("Window preset should export a Window root");

        return juce::Result::ok();
    }

    juce::Result testOptionAdjustmentsAreReported()
    {
        Saekim::SceneModel scene;
        Saekim::SceneNode button;
        button.type = "button";
        button.properties.set("text", "Go");
        button.properties.set("width", 120);
        button.properties.set("height", 32);
        scene.nodes.push_back(button);

        Saekim::ExportOptions options;
        options.className = "9 Lives";
        options.indentSize = 20;
        options.bindingMode = "Sideways";
        options.generateTheme = true;
        options.paletteOverrides.set("glow", "#FFFFFF");

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene, options);
        if (!result.success)
            return juce::Result::fail("Export failed: " + result.error);

        if (result.report.className != "_9_Lives" || result.primaryFileName != "_9_Lives.axaml")
            return juce::Result::fail("Class name not sanitized: " + result.report.className);

        if (!hasIssue(result.report, Saekim::IssueSeverity::info, "indentSize 20 clamped to 8")
            || !hasIssue(result.report, Saekim::IssueSeverity::info, "className '9 Lives' sanitized")
            || !hasIssue(result.report, Saekim::IssueSeverity::info, "bindingMode 'Sideways'")
            || !hasIssue(result.report, Saekim::IssueSeverity::warning, "Palette override 'glow' ignored"))
            return juce::Result::fail("Adjustments not reported:\n" + result.report.toText());

        if (!result.primaryContent.contains("\n        <Button\n                Classes=\"AsciiButton\""))
            return juce::Result::fail("Clamped indentation not used:\n" + result.primaryContent);

        if (result.report.hasErrors() || result.report.warningCount != 1)
            return juce::Result::fail("Unexpected issue counts:\n" + result.report.toText());

        return juce::Result::ok();
    }

    juce::Result testExportSceneJson()
    {
        const Saekim::Export::ExportOrchestrator orchestrator;

        const auto result = orchestrator.exportSceneJson(parseJson(kLoginSceneJson),
                                                         parseJson(R"({ "preset": "window", "className": "LoginWindow", "glowMode": 1 })"));
        if (!result.success)
            return juce::Result::fail("JSON export failed: " + result.error);

        if (result.primaryFileName != "LoginWindow.axaml" || !result.primaryContent.contains("x:Name=\"ok\"")
            || result.primaryContent.contains("ui-hologram"))
            return juce::Result::fail("Unexpected JSON export:\n" + result.primaryContent);

        if (!hasIssue(result.report, Saekim::IssueSeverity::info, "Option 'glowMode' ignored"))
            return juce::Result::fail("Ignored option not reported");

        const auto broken = orchestrator.exportSceneJson(parseJson(R"({ "nodes": [ { "type": "button", "y": "top" } ] })"));
        if (broken.success || broken.stage != Saekim::ExportStage::failed || !broken.files.empty()
            || broken.primaryContent.isNotEmpty() || broken.error != "scene.nodes[0].y must be numeric"
            || broken.report.errorCount != 1)
            return juce::Result::fail("Scene errors should fail the export without files");

        const auto badOptions = orchestrator.exportSceneJson(parseJson(kLoginSceneJson), juce::var(3));
        if (badOptions.success || badOptions.error != "options must be object")
            return juce::Result::fail("Non-object options should fail the export");

        return juce::Result::ok();
    }

    juce::Result testConverterFailureBecomesFailedExport()
    {
        using Saekim::Convert::ValueConverterSet;
        using Saekim::Export::ExportOrchestrator;
        using Saekim::Mapping::FrameworkAliasRegistry;
        using Saekim::Mapping::MappingRegistry;

        static_assert(std::is_constructible_v<ExportOrchestrator, const MappingRegistry&, const FrameworkAliasRegistry&, const ValueConverterSet&>);
        static_assert(!std::is_constructible_v<ExportOrchestrator, MappingRegistry&&, const FrameworkAliasRegistry&, const ValueConverterSet&>);
        static_assert(!std::is_constructible_v<ExportOrchestrator, const MappingRegistry&, FrameworkAliasRegistry&&, const ValueConverterSet&>);
        static_assert(!std::is_constructible_v<ExportOrchestrator, const MappingRegistry&, const FrameworkAliasRegistry&, ValueConverterSet&&>);

        ValueConverterSet throwingConverters;
        for (int kindIndex = 0; kindIndex <= static_cast<int>(Saekim::Convert::ConverterKind::transform); ++kindIndex)
        {
            const auto registered = throwingConverters.registerConverter(
                static_cast<Saekim::Convert::ConverterKind>(kindIndex),
                [](const juce::var&, const Saekim::Convert::ConvertOptions&, std::optional<Saekim::Convert::ConverterResult>&) -> juce::Result
                {
                    throw std::runtime_error("converter exploded");
                });
            if (!registered)
                return juce::Result::fail("Could not register converter " + juce::String(kindIndex));
        }

        const ExportOrchestrator orchestrator(Saekim::Mapping::defaultMappingRegistry(),
                                              Saekim::Mapping::defaultFrameworkAliasRegistry(),
                                              throwingConverters);

        Saekim::SceneModel scene;
        Saekim::SceneNode button;
        button.type = "ui-button";
        button.properties.set("content", "OK");
        scene.nodes.push_back(button);

        const auto result = orchestrator.exportScene(scene);
        if (result.success || result.stage != Saekim::ExportStage::failed || !result.files.empty())
            return juce::Result::fail("A throwing converter should fail the export");

        if (result.error != "Export threw during normalizing: converter exploded" || result.report.errorCount != 1)
            return juce::Result::fail("Unexpected failure report: " + result.error);

        return juce::Result::ok();
    }

    juce::Result testPreview()
    {
        Saekim::SceneModel scene;
        const auto parsed = loadLoginScene(scene);
        if (parsed.failed())
            return parsed;

        Saekim::SceneNode sparkle;
        sparkle.type = "ui-sparkle";
        Saekim::SceneNode hologram;
        hologram.type = "ui-hologram";
        hologram.children.push_back(sparkle);
        hologram.children.push_back(sparkle);
        scene.nodes.push_back(hologram);

        const Saekim::Export::ExportOrchestrator orchestrator(Saekim::Export::withPreset(Saekim::ExportPreset::project));

        Saekim::ExportPreview preview;
        const auto result = orchestrator.preview(scene, preview);
        if (result.failed())
            return result;

        if (preview.componentCount != 6 || preview.supportedCount != 3)
            return juce::Result::fail("Unexpected counts: " + juce::String(preview.componentCount) + "/" + juce::String(preview.supportedCount));

        if (preview.unsupportedTypes != juce::StringArray { "ui-hologram", "ui-sparkle" })
            return juce::Result::fail("Unsupported types: " + preview.unsupportedTypes.joinIntoString(", "));

        if (preview.estimatedFileCount != 4 || preview.rootElement != "UserControl"
            || preview.rootNamespace != "SaekimApp" || preview.className != "ExportedView")
            return juce::Result::fail("Unexpected preview summary");

        Saekim::SceneNode deep;
        deep.type = "layout-grid";
        for (int level = 0; level < Saekim::kMaxTreeDepth; ++level)
        {
            Saekim::SceneNode parent;
            parent.type = "layout-grid";
            parent.children.push_back(deep);
            deep = parent;
        }

        Saekim::SceneModel tooDeep;
        tooDeep.nodes.push_back(deep);
        Saekim::ExportPreview untouched;
        untouched.className = "kept";
        if (orchestrator.preview(tooDeep, untouched).wasOk() || untouched.className != "kept")
            return juce::Result::fail("Preview of a too-deep scene should fail without output");

        return juce::Result::ok();
    }

    juce::Result testWritingExportedFiles()
    {
        Saekim::SceneModel scene;
        const auto parsed = loadLoginScene(scene);
        if (parsed.failed())
            return parsed;

        auto options = Saekim::Export::withPreset(Saekim::ExportPreset::project);
        options.rootNamespace = "Demo";
        options.className = "Login";

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene, options);
        if (!result.success)
            return juce::Result::fail("Export failed: " + result.error);

        const auto directory = makeScratchDirectory();
        juce::Array<juce::File> written;
        auto writeResult = Saekim::Export::writeExportedFiles(result, directory, false, &written);

        auto outcome = juce::Result::ok();
        if (writeResult.failed())
            outcome = writeResult;
        else if (written.size() != 12)
            outcome = juce::Result::fail("Expected 12 written files, got " + juce::String(written.size()));
        else if (directory.getChildFile("Views/MainWindow.axaml").loadFileAsString() != result.findFile("Views/MainWindow.axaml")->content)
            outcome = juce::Result::fail("Nested file content does not match");
        else if (directory.getChildFile("Login.axaml").loadFileAsString() != result.primaryContent)
            outcome = juce::Result::fail("Markup content does not match");

        if (outcome.wasOk())
        {
            writeResult = Saekim::Export::writeExportedFiles(result, directory, false);
            if (writeResult.wasOk() || !writeResult.getErrorMessage().startsWith("Refusing to overwrite"))
                outcome = juce::Result::fail("Existing files should not be overwritten without permission");
        }

        if (outcome.wasOk())
        {
            writeResult = Saekim::Export::writeExportedFiles(result, directory, true);
            if (writeResult.failed())
                outcome = writeResult;
        }

        if (outcome.wasOk())
        {
            Saekim::ExportResult escaping;
            escaping.success = true;
            escaping.files.push_back({ "../escape.axaml", "<UserControl />\n", Saekim::FileKind::markup });
            writeResult = Saekim::Export::writeExportedFiles(escaping, directory, true);
            if (writeResult.wasOk() || directory.getSiblingFile("escape.axaml").existsAsFile())
                outcome = juce::Result::fail("Relative escape from the output directory was allowed");
        }

        if (outcome.wasOk())
        {
            Saekim::ExportResult failed;
            failed.error = "boom";
            writeResult = Saekim::Export::writeExportedFiles(failed, directory, true);
            if (writeResult.wasOk() || writeResult.getErrorMessage() != "Nothing to write: boom")
                outcome = juce::Result::fail("Failed exports must not be written");
        }

        if (!directory.deleteRecursively())
            std::cerr << "warning: could not remove " << directory.getFullPathName() << std::endl;

        return outcome;
    }

    juce::Result testWritingChecksEveryFileFirst()
    {
        Saekim::ExportResult result;
        result.success = true;
        result.files.push_back({ "First.axaml", "<UserControl />\n", Saekim::FileKind::markup });
        result.files.push_back({ "Second.axaml", "<UserControl />\n", Saekim::FileKind::markup });

        const auto directory = makeScratchDirectory();
        auto outcome = juce::Result::ok();

        if (directory.createDirectory().failed() || !directory.getChildFile("Second.axaml").replaceWithText("keep"))
            outcome = juce::Result::fail("Could not prepare the output directory");

        if (outcome.wasOk())
        {
            const auto conflict = Saekim::Export::writeExportedFiles(result, directory, false);
            if (conflict.wasOk() || !conflict.getErrorMessage().startsWith("Refusing to overwrite"))
                outcome = juce::Result::fail("Existing Second.axaml should block the export");
            else if (directory.getChildFile("First.axaml").exists())
                outcome = juce::Result::fail("First.axaml was written before the conflict was found");
            else if (directory.getChildFile("Second.axaml").loadFileAsString() != "keep")
                outcome = juce::Result::fail("Existing Second.axaml was modified");
        }

        if (outcome.wasOk())
        {
            result.files[1].fileName = "Views/../../Second.axaml";
            const auto unsafe = Saekim::Export::writeExportedFiles(result, directory, true);
            if (unsafe.wasOk() || directory.getChildFile("First.axaml").exists())
                outcome = juce::Result::fail("An unsafe second name should stop the export before any write");
        }

        if (!directory.deleteRecursively())
            std::cerr << "warning: could not remove " << directory.getFullPathName() << std::endl;

        return outcome;
    }

    juce::Result testLoadingOptionsFile()
    {
        const auto directory = makeScratchDirectory();
        const auto created = Saekim::Export::ensureDirectory(directory);
        if (created.failed())
            return created;

        const auto optionsFile = directory.getChildFile("options.json");
        auto outcome = Saekim::Export::writeTextFile(optionsFile, R"({ "rootKind": "window", "useTabs": true })", false);

        if (outcome.wasOk())
        {
            Saekim::ExportOptions options;
            outcome = Saekim::Serialization::loadOptionsFromFile(optionsFile, options);
            if (outcome.wasOk() && (options.rootKind != Saekim::RootKind::window || options.indentUnit() != "\t"))
                outcome = juce::Result::fail("Options file values not applied");
        }

        if (outcome.wasOk())
        {
            Saekim::ExportOptions options;
            const auto missing = Saekim::Serialization::loadOptionsFromFile(directory.getChildFile("absent.json"), options);
            if (missing.wasOk() || !missing.getErrorMessage().startsWith("File not found"))
                outcome = juce::Result::fail("Missing options file should be reported");
        }

        if (!directory.deleteRecursively())
            std::cerr << "warning: could not remove " << directory.getFullPathName() << std::endl;

        return outcome;
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Scene JSON parsing", testSceneJsonParsing },
        { "Scene JSON errors carry paths", testSceneJsonErrorsCarryPaths },
        { "Option overrides", testOptionOverrides },
        { "Preset file sets", testPresetFileSets },
        { "Option adjustments are reported", testOptionAdjustmentsAreReported },
        { "Export scene JSON", testExportSceneJson },
        { "Converter failure becomes a failed export", testConverterFailureBecomesFailedExport },
        { "Preview", testPreview },
        { "Writing exported files", testWritingExportedFiles },
        { "Writing checks every file first", testWritingChecksEveryFileFirst },
        { "Loading options file", testLoadingOptionsFile }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Saekim export smoke passed." << std::endl;
    return 0;
}
