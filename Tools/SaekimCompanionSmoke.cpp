#include <juce_core/juce_core.h>

#include "Saekim/Companion/CompanionSourceGenerator.h"
#include "Saekim/Companion/ProjectScaffold.h"
#include "Saekim/Normalize/TreeNormalizer.h"
#include "Saekim/Theme/StyleGenerator.h"

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

    Saekim::CanonicalNode makeCanonical(const juce::String& targetType, const juce::String& name = {})
    {
        Saekim::CanonicalNode node;
        node.sourceType = targetType;
        node.targetType = targetType;
        node.name = name;
        return node;
    }

    int countOccurrences(const juce::String& text, const juce::String& fragment)
    {
        int count = 0;
        for (auto index = text.indexOf(fragment); index >= 0; index = text.indexOf(index + fragment.length(), fragment))
            ++count;
        return count;
    }

    juce::Result expectContains(const juce::String& text, std::initializer_list<const char*> fragments, const juce::String& what)
    {
        for (const auto* fragment : fragments)
        {
            if (!text.contains(fragment))
                return juce::Result::fail(what + " is missing '" + juce::String(fragment) + "':\n" + text);
        }

        return juce::Result::ok();
    }

    std::vector<Saekim::CanonicalNode> normalizeLoginForm()
    {
        Saekim::SceneModel scene;
        auto form = makeNode("layout-stackpanel");
        form.children.push_back(makeNode("ui-textbox", { { "name", "userBox" }, { "text", "{Binding UserName}" } }));
        form.children.push_back(makeNode("ui-textblock", { { "text", "{Binding UserName}" } }));
        form.children.push_back(makeNode("ui-checkbox", { { "isChecked", "{Binding RememberMe}" } }));
        form.children.push_back(makeNode("ui-button", {
            { "name", "saveButton" },
            { "content", "Save" },
            { "command", "{Binding SaveCommand}" },
            { "onClick", "OnSave" }
        }));
        scene.nodes.push_back(form);

        Saekim::Normalize::TreeNormalizer normalizer(Saekim::Mapping::defaultMappingRegistry(),
                                                     Saekim::Mapping::defaultFrameworkAliasRegistry(),
                                                     Saekim::Convert::defaultValueConverterSet(),
                                                     Saekim::ExportOptions {});

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        if (normalizer.normalize(scene, nodes, report).failed())
            nodes.clear();
        return nodes;
    }

    juce::Result testBindingPropertiesAreDeduplicated()
    {
        const auto nodes = normalizeLoginForm();
        if (nodes.size() != 1)
            return juce::Result::fail("Login form did not normalize");

        const auto properties = Saekim::Companion::collectBindingProperties(nodes);
        if (properties.size() != 2)
            return juce::Result::fail("Expected UserName and RememberMe, got " + juce::String(static_cast<int>(properties.size())));

        if (properties[0].name != "UserName" || properties[0].typeName != "string" || properties[0].targetProperty != "Text")
            return juce::Result::fail("UserName should be inferred as string from Text");

        if (properties[1].name != "RememberMe" || properties[1].typeName != "bool?")
            return juce::Result::fail("RememberMe should be inferred as bool? from IsChecked");

        const auto commands = Saekim::Companion::collectCommands(nodes);
        if (commands != juce::StringArray { "Save" })
            return juce::Result::fail("Expected a single Save command, got: " + commands.joinIntoString(", "));

        Saekim::ExportOptions options;
        options.className = "LoginView";
        options.rootNamespace = "Demo";
        const Saekim::Companion::CompanionSourceGenerator generator(options);
        const auto viewModel = generator.generateViewModelSource(nodes, "LoginView");

        const auto contains = expectContains(viewModel, {
            "namespace Demo.ViewModels",
            "public class LoginViewModel : INotifyPropertyChanged",
            "        private string _userName = string.Empty;",
            "        public string UserName",
            "                if (_userName != value)",
            "                    OnPropertyChanged(nameof(UserName));",
            "        private bool? _rememberMe;",
            "        public ICommand? SaveCommand { get; }",
            "        private void ExecuteSave()",
            "        private bool CanExecuteSave()",
            "        public event PropertyChangedEventHandler? PropertyChanged;"
        }, "Plain view model");
        if (contains.failed())
            return contains;

        if (countOccurrences(viewModel, "public string UserName") != 1)
            return juce::Result::fail("UserName declared more than once");

        if (!viewModel.endsWith("}\n"))
            return juce::Result::fail("View model should end with a newline");

        return juce::Result::ok();
    }

    juce::Result testBindingPathArguments()
    {
        const std::vector<std::pair<const char*, const char*>> viewModelPaths {
            { "{Binding UserName}", "UserName" },
            { "{Binding Mode=OneWay, Path=Total}", "Total" },
            { "{Binding Path=Order.Total, Mode=TwoWay}", "Order" },
            { "{Binding Total, Converter={StaticResource MoneyConverter}, Mode=OneWay}", "Total" },
            { "{CompiledBinding Path=Volume}", "Volume" }
        };

        for (const auto& [expression, expected] : viewModelPaths)
        {
            const auto path = Saekim::Companion::bindingPath(expression);
            if (!path.has_value() || *path != expected)
                return juce::Result::fail(juce::String(expression) + " should bind to " + expected);
        }

        for (const auto* expression : { "{Binding ElementName=slider, Path=Value}",
                                        "{Binding Path=Value, ElementName=slider}",
                                        "{Binding RelativeSource={RelativeSource Self}, Path=Tag}",
                                        "{Binding #slider.Value}",
                                        "{Binding $parent[Window].Title}",
                                        "{Binding}",
                                        "Plain text" })
        {
            if (Saekim::Companion::bindingPath(expression).has_value())
                return juce::Result::fail(juce::String(expression) + " does not target the view model");
        }

        auto label = makeCanonical("TextBlock");
        label.attributes.set("Text", "{Binding ElementName=slider, Path=Value}");
        auto total = makeCanonical("TextBlock");
        total.attributes.set("Text", "{Binding Mode=OneWay, Path=Total}");

        const auto properties = Saekim::Companion::collectBindingProperties({ label, total });
        if (properties.size() != 1 || properties[0].name != "Total")
            return juce::Result::fail("Only Total should become a view model property");

        return juce::Result::ok();
    }

    juce::Result testAttachedBindingsReachViewModel()
    {
        Saekim::SceneModel scene;
        scene.nodes.push_back(makeNode("ui-textbox", { { "text", "{Binding Note}" }, { "gridRow", "{Binding Row}" } }));

        Saekim::Normalize::TreeNormalizer normalizer(Saekim::Mapping::defaultMappingRegistry(),
                                                     Saekim::Mapping::defaultFrameworkAliasRegistry(),
                                                     Saekim::Convert::defaultValueConverterSet(),
                                                     Saekim::ExportOptions {});

        std::vector<Saekim::CanonicalNode> nodes;
        Saekim::ExportReport report;
        const auto normalized = normalizer.normalize(scene, nodes, report);
        if (normalized.failed())
            return normalized;

        if (nodes.size() != 1 || nodes[0].attachedProperties["Grid.Row"] != "{Binding Row}")
            return juce::Result::fail("Grid.Row binding was not kept as an attached property");

        const auto properties = Saekim::Companion::collectBindingProperties(nodes);
        if (properties.size() != 2 || properties[0].name != "Note"
            || properties[1].name != "Row" || properties[1].typeName != "int" || properties[1].targetProperty != "Grid.Row")
        {
            return juce::Result::fail("Row should be collected as an int from Grid.Row");
        }

        const Saekim::Companion::CompanionSourceGenerator generator(Saekim::ExportOptions {});
        return expectContains(generator.generateViewModelSource(nodes, "NotesView"),
                              { "        private int _row;", "        public int Row" },
                              "Attached binding view model");
    }

    juce::Result testViewModelIdioms()
    {
        const auto nodes = normalizeLoginForm();

        Saekim::ExportOptions options;
        options.rootNamespace = "Demo";

        options.viewModelIdiom = Saekim::ViewModelIdiom::communityToolkit;
        const auto toolkit = Saekim::Companion::CompanionSourceGenerator(options).generateViewModelSource(nodes, "LoginView");
        auto result = expectContains(toolkit, {
            "using CommunityToolkit.Mvvm.ComponentModel;",
            "public partial class LoginViewModel : ObservableObject",
            "        [ObservableProperty]\n        private string _userName = string.Empty;",
            "        [RelayCommand]\n        private void Save()"
        }, "Toolkit view model");
        if (result.failed())
            return result;

        if (toolkit.contains("OnPropertyChanged(nameof("))
            return juce::Result::fail("Toolkit view model should not hand-write notifications");

        options.viewModelIdiom = Saekim::ViewModelIdiom::reactiveUI;
        const auto reactive = Saekim::Companion::CompanionSourceGenerator(options).generateViewModelSource(nodes, "LoginView");
        result = expectContains(reactive, {
            "using ReactiveUI;",
            "public class LoginViewModel : ReactiveObject",
            "            SaveCommand = ReactiveCommand.Create(ExecuteSave);",
            "            set => this.RaiseAndSetIfChanged(ref _userName, value);",
            "        public ReactiveCommand<Unit, Unit> SaveCommand { get; }"
        }, "ReactiveUI view model");
        if (result.failed())
            return result;

        return juce::Result::ok();
    }

    juce::Result testEventHandlerStubs()
    {
        auto save = makeCanonical("Button", "saveButton");
        save.events.set("Click", "OnSave");
        auto saveAgain = makeCanonical("Button", "saveAgainButton");
        saveAgain.events.set("Click", "OnSave");
        auto picker = makeCanonical("ListBox");
        picker.events.set("SelectionChanged", "OnPick");

        auto panel = makeCanonical("StackPanel");
        panel.children = { save, saveAgain, picker };

        const std::vector<Saekim::CanonicalNode> nodes { panel };
        const auto handlers = Saekim::Companion::collectEventHandlers(nodes);
        if (handlers.size() != 2 || handlers[0].methodName != "OnSave" || handlers[1].methodName != "OnPick")
            return juce::Result::fail("Handlers should be deduplicated in tree order");

        if (handlers[0].argsType != "RoutedEventArgs" || handlers[1].argsType != "SelectionChangedEventArgs"
            || handlers[0].component != "saveButton" || handlers[1].component != "ListBox")
            return juce::Result::fail("Unexpected handler metadata");

        Saekim::ExportOptions options;
        options.rootNamespace = "Demo";
        options.includeViewModel = true;
        const Saekim::Companion::CompanionSourceGenerator generator(options);
        const auto source = generator.generateCompanionSource(nodes, "MainView", Saekim::RootKind::userControl);

        const auto contains = expectContains(source, {
            "using Avalonia.Interactivity;",
            "using Demo.ViewModels;",
            "namespace Demo",
            "    public partial class MainView : UserControl",
            "            InitializeComponent();\n            DataContext = new MainViewModel();",
            "        /// Handles Click for saveButton",
            "        private void OnSave(object? sender, RoutedEventArgs e)",
            "            // TODO: Implement OnSave",
            "        private void OnPick(object? sender, SelectionChangedEventArgs e)"
        }, "Code-behind");
        if (contains.failed())
            return contains;

        if (countOccurrences(source, "private void OnSave(") != 1)
            return juce::Result::fail("Duplicate handler stub emitted");

        options.includeViewModel = false;
        options.includeComments = false;
        const auto bare = Saekim::Companion::CompanionSourceGenerator(options)
                              .generateCompanionSource({ makeCanonical("TextBlock") }, "Plain", Saekim::RootKind::userControl);
        if (bare.contains("DataContext") || bare.contains("Avalonia.Interactivity") || bare.contains("/// <summary>"))
            return juce::Result::fail("Handler-free code-behind carries unused parts:\n" + bare);

        return juce::Result::ok();
    }

    juce::Result testValueConverterStub()
    {
        Saekim::ExportOptions options;
        options.rootNamespace = "Demo";
        const auto source = Saekim::Companion::CompanionSourceGenerator(options)
                                .generateValueConverter("Bool To Text", "bool", "string");

        return expectContains(source, {
            "namespace Demo.Converters",
            "    public class Bool_To_Text : IValueConverter",
            "            if (value is bool source)",
            "                return default(string);",
            "            return AvaloniaProperty.UnsetValue;",
            "            throw new NotImplementedException();"
        }, "Value converter");
    }

    juce::Result testThemePalette()
    {
        auto palette = Saekim::Theme::ThemePalette::makeDefault();
        if (palette.colors.size() != 21 || palette.find("primary") == nullptr || palette.find("missing") != nullptr)
            return juce::Result::fail("Default palette is incomplete");

        juce::StringPairArray overrides;
        overrides.set("primary", "#FF0000");
        overrides.set("BACKGROUND", "rgb(16, 16, 16)");
        overrides.set("glow", "#00FF00");
        overrides.set("error", "#12345");
        overrides.set("fontSizeNormal", "14");

        juce::StringArray rejected;
        palette.applyOverrides(overrides, rejected);

        if (rejected != juce::StringArray { "glow", "error" })
            return juce::Result::fail("Unexpected rejected overrides: " + rejected.joinIntoString(", "));

        if (palette.find("primary")->color != "#FF0000" || palette.find("background")->color != "#101010"
            || palette.find("error")->color != "#F14C4C" || palette.fonts.sizeNormal != "14")
            return juce::Result::fail("Overrides were not applied as expected");

        if (Saekim::Theme::toResourceName("backgroundAlt") != "BackgroundAlt")
            return juce::Result::fail("Resource name should be PascalCased");

        const Saekim::Theme::StyleGenerator generator(palette, Saekim::ExportOptions {});
        const auto theme = generator.generateTheme();

        const auto contains = expectContains(theme, {
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<ResourceDictionary\n",
            "    <Color x:Key=\"PrimaryColor\">#FF0000</Color>",
            "    <SolidColorBrush x:Key=\"Primary\" Color=\"{StaticResource PrimaryColor}\" />",
            "    <!-- Button Styles -->",
            "    <Style Selector=\"Button.AsciiButton:pointerover\">",
            "        <Setter Property=\"Background\" Value=\"{DynamicResource Hover}\" />",
            "        <Setter Property=\"FontFamily\" Value=\"Consolas, &quot;Courier New&quot;, monospace\" />",
            "        <Setter Property=\"FontSize\" Value=\"14\" />",
            "    <Style Selector=\"TextBlock.AsciiArt\">"
        }, "Theme");
        if (contains.failed())
            return contains;

        if (!theme.endsWith("</ResourceDictionary>\n") || theme.contains("<!-- Component Styles -->"))
            return juce::Result::fail("Theme without extra targets should only contain the catalog");

        return juce::Result::ok();
    }

    juce::Result testThemeFallbackStyles()
    {
        const Saekim::Theme::StyleGenerator generator(Saekim::Theme::ThemePalette::makeDefault(), Saekim::ExportOptions {});

        const auto buttonGroup = generator.generateControlStyle("Button");
        if (!buttonGroup.startsWith("<!-- Button Styles -->\n<Style Selector=\"Button.AsciiButton\">"))
            return juce::Result::fail("Catalog group not returned for Button:\n" + buttonGroup);

        const auto slider = generator.generateControlStyle("Slider", "AsciiSlider");
        const auto expectedSlider = "<Style Selector=\"Slider.AsciiSlider\">\n"
                                    "    <Setter Property=\"FontFamily\" Value=\"Consolas, &quot;Courier New&quot;, monospace\" />\n"
                                    "</Style>";
        if (slider != expectedSlider)
            return juce::Result::fail("Unexpected fallback block:\n" + slider);

        if (!generator.catalogCovers({ "Border", "AsciiCard" }) || generator.catalogCovers({ "Slider", "AsciiSlider" }))
            return juce::Result::fail("Catalog coverage check is wrong");

        const auto theme = generator.generateTheme({
            { "Button", "AsciiButton" },
            { "Slider", "AsciiSlider" },
            { "Slider", "AsciiSlider" },
            { "Expander", "" }
        });

        if (countOccurrences(theme, "<!-- Component Styles -->") != 1
            || countOccurrences(theme, "Selector=\"Slider.AsciiSlider\"") != 1
            || countOccurrences(theme, "Selector=\"Button.AsciiButton\"") != 1
            || !theme.contains("Selector=\"Expander.AsciiExpander\""))
        {
            return juce::Result::fail("Component styles not deduplicated against the catalog");
        }

        auto button = makeCanonical("Button");
        button.styleClass = "AsciiButton";
        auto card = makeCanonical("Border");
        card.styleClass = "AsciiCard";
        card.children = { button, button };
        const auto targets = Saekim::Theme::collectStyleTargets({ card });
        if (targets.size() != 2 || targets[0].controlType != "Border" || targets[1].styleClass != "AsciiButton")
            return juce::Result::fail("Style targets should be collected depth-first without duplicates");

        return juce::Result::ok();
    }

    juce::Result testProjectScaffold()
    {
        Saekim::ExportOptions options;
        options.rootNamespace = "Demo";
        options.className = "LoginView";
        options.generateTheme = true;
        options.viewModelIdiom = Saekim::ViewModelIdiom::communityToolkit;

        const auto files = Saekim::Companion::generateProjectScaffold(options);
        const juce::StringArray expectedNames {
            "Demo.csproj",
            "Program.cs",
            "App.axaml",
            "App.axaml.cs",
            "ViewModels/ViewModelBase.cs",
            "ViewModels/MainWindowViewModel.cs",
            "Views/MainWindow.axaml",
            "Views/MainWindow.axaml.cs"
        };

        if (files.size() != static_cast<size_t>(expectedNames.size()))
            return juce::Result::fail("Scaffold should contain 8 files");

        for (size_t i = 0; i < files.size(); ++i)
        {
            if (files[i].fileName != expectedNames[static_cast<int>(i)] || files[i].kind != Saekim::FileKind::project)
                return juce::Result::fail("Unexpected scaffold file: " + files[i].fileName);
            if (!files[i].content.endsWith("\n"))
                return juce::Result::fail(files[i].fileName + " should end with a newline");
        }

        auto result = expectContains(files[0].content, {
            "<Project Sdk=\"Microsoft.NET.Sdk\">",
            "    <RootNamespace>Demo</RootNamespace>",
            "    <PackageReference Include=\"Avalonia\" Version=\"11.1.0\" />",
            "    <PackageReference Include=\"CommunityToolkit.Mvvm\" Version=\"8.2.2\" />"
        }, "Project file");
        if (result.failed())
            return result;

        if (files[0].content.contains("Avalonia.ReactiveUI"))
            return juce::Result::fail("ReactiveUI package should only be referenced for the ReactiveUI idiom");

        result = expectContains(files[2].content, {
            "x:Class=\"Demo.App\"",
            "<StyleInclude Source=\"avares://Demo/AsciiTheme.axaml\" />"
        }, "Application markup");
        if (result.failed())
            return result;

        result = expectContains(files[6].content, {
            "x:Class=\"Demo.Views.MainWindow\"",
            "    <local:LoginView />"
        }, "Main window markup");
        if (result.failed())
            return result;

        options.viewModelIdiom = Saekim::ViewModelIdiom::reactiveUI;
        result = expectContains(Saekim::Companion::generateProgramSource(options), {
            "using Avalonia.ReactiveUI;",
            ".LogToTrace()\n",
            ".UseReactiveUI();"
        }, "ReactiveUI program");
        if (result.failed())
            return result;

        options.viewModelIdiom = Saekim::ViewModelIdiom::plain;
        return expectContains(Saekim::Companion::generateViewModelBase(options), {
            "public class ViewModelBase : INotifyPropertyChanged",
            "protected bool SetProperty<T>(ref T field, T value, [CallerMemberName] string? propertyName = null)"
        }, "Plain view model base");
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Binding properties are deduplicated", testBindingPropertiesAreDeduplicated },
        { "Binding path arguments", testBindingPathArguments },
        { "Attached bindings reach the view model", testAttachedBindingsReachViewModel },
        { "View model idioms", testViewModelIdioms },
        { "Event handler stubs", testEventHandlerStubs },
        { "Value converter stub", testValueConverterStub },
        { "Theme palette", testThemePalette },
        { "Theme fallback styles", testThemeFallbackStyles },
        { "Project scaffold", testProjectScaffold }
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

    std::cout << "Saekim companion smoke passed." << std::endl;
    return 0;
}
