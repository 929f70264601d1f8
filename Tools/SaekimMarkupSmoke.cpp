#include <juce_core/juce_core.h>

#include "Saekim/Export/ExportOrchestrator.h"
#include "Saekim/Markup/MarkupGenerator.h"
#include "Saekim/Normalize/TreeNormalizer.h"

#include <algorithm>
#include <functional>
#include <iostream>
#include <vector>

namespace
{
    Saekim::SceneNode makeNode(const juce::String& type,
                               std::initializer_list<std::pair<const char*, juce::var>> properties = {})
    {
        Saekim::SceneNode node;
        node.type = type;
        for (const auto& [key, value] : properties)
            node.properties.set(key, value);
        return node;
    }

    Saekim::Normalize::TreeNormalizer makeNormalizer(const Saekim::ExportOptions& options = {})
    {
        return Saekim::Normalize::TreeNormalizer(Saekim::Mapping::defaultMappingRegistry(),
                                                 Saekim::Mapping::defaultFrameworkAliasRegistry(),
                                                 Saekim::Convert::defaultValueConverterSet(),
                                                 options);
    }

    juce::Result normalizeScene(const Saekim::SceneModel& scene,
                                std::vector<Saekim::CanonicalNode>& nodesOut,
                                Saekim::ExportReport& reportOut,
                                const Saekim::ExportOptions& options = {})
    {
        return makeNormalizer(options).normalize(scene, nodesOut, reportOut);
    }

    juce::String joinLines(std::initializer_list<const char*> lines)
    {
        juce::StringArray joined;
        for (const auto* line : lines)
            joined.add(line);
        return joined.joinIntoString("\n");
    }

    juce::Result testFlatButtonScenario()
    {
        Saekim::SceneModel scene;
        scene.nodes.push_back(makeNode("button", { { "text", "OK" } }));

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto normalized = normalizeScene(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        if (nodes.size() != 1 || nodes.front().targetType != "Button")
            return juce::Result::fail("button should map to Button");

        const auto& button = nodes.front();
        if (button.attributes.size() != 1 || button.attributes["Content"] != "OK" || button.attachedProperties.size() != 0)
            return juce::Result::fail("Button should carry only Content=OK");

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene);
        if (!result.success)
            return juce::Result::fail("Export failed: " + result.error);

        if (!result.primaryContent.contains("\n    <Button Content=\"OK\" />\n"))
            return juce::Result::fail("Markup does not contain the flat button:\n" + result.primaryContent);

        return juce::Result::ok();
    }

    juce::Result testPositionedPairScenario()
    {
        Saekim::SceneModel scene;
        auto first = makeNode("button", { { "text", "A" } });
        first.x = 10.0;
        first.y = 20.0;
        auto second = makeNode("button", { { "text", "B" } });
        second.x = 30.0;
        second.y = 5.0;
        scene.nodes.push_back(first);
        scene.nodes.push_back(second);

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene);
        if (!result.success)
            return juce::Result::fail("Export failed: " + result.error);

        const auto& markup = result.primaryContent;
        const auto expected = joinLines({
            "    <Canvas>",
            "        <Button",
            "            Content=\"A\"",
            "            Canvas.Left=\"10\"",
            "            Canvas.Top=\"20\" />",
            "        <Button",
            "            Content=\"B\"",
            "            Canvas.Left=\"30\"",
            "            Canvas.Top=\"5\" />",
            "    </Canvas>"
        });

        if (!markup.contains(expected))
            return juce::Result::fail("Positioned pair not wrapped in one Canvas:\n" + markup);

        if (markup.indexOf("<Canvas>") != markup.lastIndexOf("<Canvas>"))
            return juce::Result::fail("More than one positioning container emitted");

        return juce::Result::ok();
    }

    juce::Result testDefaultsAreNotEmitted()
    {
        Saekim::SceneModel scene;
        auto node = makeNode("ui-button", {
            { "width", "auto" },
            { "height", "Auto" },
            { "enabled", true },
            { "isDefault", false },
            { "clickMode", "Release" },
            { "margin", 0 },
            { "opacity", 1 },
            { "horizontalAlignment", "stretch" },
            { "gridRow", 0 },
            { "zIndex", 0 }
        });
        node.name = "okButton";
        node.x = 0.0;
        node.y = 0.0;
        scene.nodes.push_back(node);

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto normalized = normalizeScene(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        const auto& canonical = nodes.front();
        if (canonical.name != "okButton")
            return juce::Result::fail("Identity was not kept");

        if (canonical.attributes.size() != 0 || canonical.attachedProperties.size() != 0 || canonical.hasContent())
        {
            return juce::Result::fail("Default-valued properties leaked: "
                                      + canonical.attributes.getDescription()
                                      + canonical.attachedProperties.getDescription());
        }

        const Saekim::Markup::MarkupGenerator generator(Saekim::ExportOptions {});
        const auto markup = generator.generateNode(canonical, 0);
        if (markup != "<Button x:Name=\"okButton\" />")
            return juce::Result::fail("Unexpected minimal markup: " + markup);

        return juce::Result::ok();
    }

    juce::Result testAttributeOrderIgnoresInsertionOrder()
    {
        auto scrambled = makeNode("ui-textbox", {
            { "opacity", 0.5 },
            { "gridRow", 2 },
            { "margin", "4" },
            { "placeholder", "Type" },
            { "name", "nameBox" },
            { "text", "Hi" }
        });
        scrambled.x = 5.0;

        auto ordered = makeNode("ui-textbox", {
            { "text", "Hi" },
            { "name", "nameBox" },
            { "placeholder", "Type" },
            { "margin", "4" },
            { "gridRow", 2 },
            { "opacity", 0.5 }
        });
        ordered.x = 5.0;

        const auto expected = joinLines({
            "<TextBox",
            "    x:Name=\"nameBox\"",
            "    Text=\"Hi\"",
            "    Watermark=\"Type\"",
            "    Margin=\"4\"",
            "    Opacity=\"0.5\"",
            "    Grid.Row=\"2\"",
            "    Canvas.Left=\"5\" />"
        });

        const Saekim::Markup::MarkupGenerator generator(Saekim::ExportOptions {});

        for (const auto& source : { scrambled, ordered })
        {
            Saekim::SceneModel scene;
            scene.nodes.push_back(source);

            std::vector<Saekim::CanonicalNode> nodes;
            Saekim::ExportReport report;
            const auto normalized = normalizeScene(scene, nodes, report);
            if (normalized.failed())
                return normalized;

            const auto markup = generator.generateNode(nodes.front(), 0);
            if (markup != expected)
                return juce::Result::fail("Attribute order differs:\n" + markup);
        }

        return juce::Result::ok();
    }

    juce::Result testGenerationIsIdempotent()
    {
        Saekim::SceneModel scene;
        scene.title = "Settings";

        auto panel = makeNode("layout-stackpanel", { { "orientation", "horizontal" }, { "spacing", 8 } });
        panel.children.push_back(makeNode("ui-checkbox", { { "label", "Enable sync" }, { "checked", true } }));
        panel.children.push_back(makeNode("ui-textbox", { { "text", "{Binding ServerUrl}" }, { "onTextChanged", "OnUrlChanged" } }));
        panel.children.push_back(makeNode("ui-border", { { "background", "#202020" } }));
        scene.nodes.push_back(panel);

        std::vector<Saekim::CanonicalNode> firstNodes;
        std::vector<Saekim::CanonicalNode> secondNodes;
        Saekim::ExportReport firstReport;
        Saekim::ExportReport secondReport;

        const auto first = normalizeScene(scene, firstNodes, firstReport);
        const auto second = normalizeScene(scene, secondNodes, secondReport);
        if (first.failed() || second.failed())
            return juce::Result::fail("Normalization failed");

        const Saekim::Markup::MarkupGenerator generator(Saekim::ExportOptions {});
        const auto info = Saekim::Markup::makeDocumentInfo(scene);

        const auto firstMarkup = generator.generateDocument(firstNodes, info);
        const auto secondMarkup = generator.generateDocument(secondNodes, info);
        const auto repeatMarkup = generator.generateDocument(firstNodes, info);

        if (firstMarkup != secondMarkup || firstMarkup != repeatMarkup)
            return juce::Result::fail("Markup generation is not byte-identical across runs");

        if (!firstMarkup.contains("Text=\"{Binding ServerUrl}\"") || !firstMarkup.contains("TextChanged=\"OnUrlChanged\""))
            return juce::Result::fail("Binding or event attribute missing:\n" + firstMarkup);

        return juce::Result::ok();
    }

    juce::Result testUnresolvableTypeBecomesPlaceholder()
    {
        Saekim::SceneModel scene;
        auto hologram = makeNode("ui-hologram", { { "glow", 3 } });
        hologram.children.push_back(makeNode("button", { { "text", "OK" } }));
        scene.nodes.push_back(hologram);

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene);
        if (!result.success)
            return juce::Result::fail("Export should succeed with a placeholder: " + result.error);

        const auto& markup = result.primaryContent;
        if (!markup.contains("<!-- Unmapped component: ui-hologram -->")
            || !markup.contains("Tag=\"ui-hologram\"")
            || !markup.contains("<ContentControl")
            || !markup.contains("<Button Content=\"OK\" />"))
        {
            return juce::Result::fail("Placeholder or its child is missing:\n" + markup);
        }

        if (result.report.issues.empty() || result.report.warningCount == 0)
            return juce::Result::fail("Placeholder should be reported");

        if (result.report.unsupportedCount != 1 || result.report.supportedCount != 1 || result.report.nodeCount != 2)
            return juce::Result::fail("Unexpected node counters: " + result.report.toText());

        return juce::Result::ok();
    }

    juce::Result testNestingDepthLimit()
    {
        const auto makeChain = [](int depth)
        {
            auto node = makeNode("layout-stackpanel");
            for (int level = 1; level < depth; ++level)
            {
                auto parent = makeNode("layout-stackpanel");
                parent.children.push_back(std::move(node));
                node = std::move(parent);
            }
            return node;
        };

        Saekim::SceneModel allowed;
        allowed.nodes.push_back(makeChain(Saekim::kMaxTreeDepth));

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto allowedResult = normalizeScene(allowed, nodes, report);
        if (allowedResult.failed())
            return juce::Result::fail("64 levels should be accepted: " + allowedResult.getErrorMessage());

        Saekim::SceneModel tooDeep;
        tooDeep.nodes.push_back(makeChain(Saekim::kMaxTreeDepth + 6));

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(tooDeep);
        if (result.success || result.stage != Saekim::ExportStage::failed || !result.files.empty())
            return juce::Result::fail("Deep tree should fail with no files");

        if (!result.error.contains("deeper than 64") || !result.error.contains("scene.nodes[0]"))
            return juce::Result::fail("Unexpected depth error: " + result.error);

        return juce::Result::ok();
    }

    juce::Result testMultilineTextContent()
    {
        Saekim::SceneModel scene;
        scene.nodes.push_back(makeNode("ui-textblock", { { "text", "Line 1\nLine <2>" } }));

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto normalized = normalizeScene(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        const Saekim::Markup::MarkupGenerator generator(Saekim::ExportOptions {});
        const auto markup = generator.generateNode(nodes.front(), 1);
        const auto expected = joinLines({
            "    <TextBlock>",
            "        <TextBlock.Text>",
            "            Line 1",
            "            Line &lt;2&gt;",
            "        </TextBlock.Text>",
            "    </TextBlock>"
        });

        if (markup != expected)
            return juce::Result::fail("Unexpected text content encoding:\n" + markup);

        return juce::Result::ok();
    }

    juce::Result testDocumentRootAndResources()
    {
        Saekim::SceneModel scene;
        scene.title = "Demo & Co";
        scene.width = 1024.0;
        scene.resources.push_back({ "AccentBrush", "#FF0000" });
        scene.resources.push_back({ "Greeting", "Hello" });
        scene.nodes.push_back(makeNode("ui-label", { { "content", "Hi" } }));

        Saekim::ExportOptions options;
        options.rootKind = Saekim::RootKind::window;
        options.className = "MainView";
        options.rootNamespace = "Demo.App";

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene, options);
        if (!result.success)
            return juce::Result::fail("Export failed: " + result.error);

        const auto& markup = result.primaryContent;
        if (!markup.startsWith("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<Window\n"))
            return juce::Result::fail("Missing preamble or Window root:\n" + markup);

        for (const auto* fragment : {
                 "    xmlns=\"https://github.com/avaloniaui\"",
                 "    xmlns:local=\"clr-namespace:Demo.App\"",
                 "    d:DesignWidth=\"1024\" d:DesignHeight=\"600\"",
                 "    x:Class=\"Demo.App.MainView\"",
                 "    Title=\"Demo &amp; Co\">",
                 "    <Window.Resources>",
                 "        <SolidColorBrush x:Key=\"AccentBrush\" Color=\"#FF0000\" />",
                 "        <x:String x:Key=\"Greeting\">Hello</x:String>",
                 "    <Label Content=\"Hi\" />" })
        {
            if (!markup.contains(fragment))
                return juce::Result::fail("Missing '" + juce::String(fragment) + "' in:\n" + markup);
        }

        if (!markup.endsWith("</Window>\n"))
            return juce::Result::fail("Document should end with the closing root tag and a newline");

        options.includeDesignTimeData = false;
        const auto plain = orchestrator.exportScene(scene, options);
        if (plain.primaryContent.contains("xmlns:d=") || plain.primaryContent.contains("d:DesignWidth"))
            return juce::Result::fail("Design-time attributes should be omitted when disabled");

        return juce::Result::ok();
    }

    juce::Result testGenericTargetTypes()
    {
        Saekim::SceneModel scene;
        auto gauge = makeNode("gauge", {
            { "tickCount", 10 },
            { "needleColor", "#FF0000" },
            { "background", "#000000" },
            { "showTicks", true }
        });
        gauge.targetType = "CustomGauge";
        gauge.targetNamespace = "MyApp.Controls";
        scene.nodes.push_back(gauge);

        const Saekim::Export::ExportOrchestrator orchestrator;
        const auto result = orchestrator.exportScene(scene);
        if (!result.success)
            return juce::Result::fail("Export failed: " + result.error);

        const auto expected = joinLines({
            "    <controls:CustomGauge",
            "        Background=\"#000000\"",
            "        NeedleColor=\"#FF0000\"",
            "        ShowTicks=\"True\"",
            "        TickCount=\"10\" />"
        });

        if (!result.primaryContent.contains("    xmlns:controls=\"using:MyApp.Controls\"")
            || !result.primaryContent.contains(expected))
        {
            return juce::Result::fail("Generic element not emitted as expected:\n" + result.primaryContent);
        }

        if (result.report.supportedCount != 1)
            return juce::Result::fail("Explicit target types count as supported");

        return juce::Result::ok();
    }

    juce::Result testHiddenLayersAreSkipped()
    {
        Saekim::SceneModel scene;

        Saekim::SceneLayer hidden;
        hidden.name = "Guides";
        hidden.visible = false;
        hidden.nodes.push_back(makeNode("button", { { "text", "Hidden" } }));

        Saekim::SceneLayer visible;
        visible.name = "Main";
        visible.nodes.push_back(makeNode("button", { { "text", "First" } }));

        scene.layers.push_back(hidden);
        scene.layers.push_back(visible);
        scene.nodes.push_back(makeNode("button", { { "text", "Last" } }));

        const auto flat = Saekim::Normalize::flattenScene(scene);
        if (flat.size() != 2 || flat[0].path != "scene.layers[1].nodes[0]" || flat[1].path != "scene.nodes[0]")
            return juce::Result::fail("Unexpected flattening order");

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto normalized = normalizeScene(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        if (nodes.size() != 2 || nodes[0].attributes["Content"] != "First" || nodes[1].attributes["Content"] != "Last")
            return juce::Result::fail("Hidden layer leaked into the export");

        return juce::Result::ok();
    }

    juce::Result testPanelsKeepOnlyTheirAttachedProperties()
    {
        Saekim::SceneModel scene;

        auto dockPanel = makeNode("layout-dockpanel");
        auto docked = makeNode("ui-button", { { "gridRow", 1 }, { "dock", "left" }, { "zIndex", 2 } });
        docked.name = "dockedButton";
        docked.x = 10.0;
        dockPanel.children.push_back(docked);
        scene.nodes.push_back(dockPanel);

        auto grid = makeNode("layout-grid");
        grid.children.push_back(makeNode("ui-button", { { "gridRow", 1 }, { "dock", "top" } }));
        scene.nodes.push_back(grid);

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto normalized = normalizeScene(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        if (nodes.size() != 2 || nodes[0].children.size() != 1 || nodes[1].children.size() != 1)
            return juce::Result::fail("Unexpected tree shape");

        const auto& dockedAttached = nodes[0].children[0].attachedProperties;
        if (dockedAttached.getAllKeys() != juce::StringArray { "DockPanel.Dock", "Panel.ZIndex" }
            || dockedAttached["DockPanel.Dock"] != "Left" || dockedAttached["Panel.ZIndex"] != "2")
        {
            return juce::Result::fail("DockPanel child attached properties: " + dockedAttached.getDescription());
        }

        const auto& gridAttached = nodes[1].children[0].attachedProperties;
        if (gridAttached.getAllKeys() != juce::StringArray { "Grid.Row" } || gridAttached["Grid.Row"] != "1")
            return juce::Result::fail("Grid child attached properties: " + gridAttached.getDescription());

        const auto droppedNotice = std::any_of(report.issues.begin(),
                                               report.issues.end(),
                                               [](const Saekim::ExportIssue& issue)
                                               {
                                                   return issue.severity == Saekim::IssueSeverity::info
                                                       && issue.message == "ui-button 'dockedButton': Grid.Row dropped, DockPanel does not honour it";
                                               });
        if (!droppedNotice)
            return juce::Result::fail("Dropped Grid.Row was not reported");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Flat button", testFlatButtonScenario },
        { "Positioned pair", testPositionedPairScenario },
        { "Defaults are not emitted", testDefaultsAreNotEmitted },
        { "Attribute order ignores insertion order", testAttributeOrderIgnoresInsertionOrder },
        { "Generation is idempotent", testGenerationIsIdempotent },
        { "Unresolvable type becomes placeholder", testUnresolvableTypeBecomesPlaceholder },
        { "Nesting depth limit", testNestingDepthLimit },
        { "Multiline text content", testMultilineTextContent },
        { "Document root and resources", testDocumentRootAndResources },
        { "Generic target types", testGenericTargetTypes },
        { "Hidden layers are skipped", testHiddenLayersAreSkipped },
        { "Panels keep only their attached properties", testPanelsKeepOnlyTheirAttachedProperties }
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

    std::cout << "Saekim markup smoke passed." << std::endl;
    return 0;
}
