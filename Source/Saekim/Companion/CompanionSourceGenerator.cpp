#include "Saekim/Companion/CompanionSourceGenerator.h"

#include "Saekim/Core/Identifiers.h"
#include <algorithm>

namespace
{
    using Saekim::CanonicalNode;
    using Saekim::Companion::BindingPropertyInfo;
    using Saekim::Companion::EventHandlerInfo;

    struct TypeRule
    {
        const char* targetProperty;
        const char* typeName;
    };

    constexpr TypeRule kTypeRules[] = {
        { "Text", "string" },
        { "Content", "string" },
        { "Title", "string" },
        { "Header", "string" },
        { "Value", "double" },
        { "Minimum", "double" },
        { "Maximum", "double" },
        { "IsChecked", "bool?" },
        { "IsEnabled", "bool" },
        { "IsVisible", "bool" },
        { "SelectedIndex", "int" },
        { "SelectedItem", "object?" },
        { "Items", "ObservableCollection<object>" },
        { "ItemsSource", "ObservableCollection<object>" },
        { "SelectedDate", "DateTime?" },
        { "SelectedTime", "TimeSpan?" },
        { "Grid.Row", "int" },
        { "Grid.Column", "int" },
        { "Grid.RowSpan", "int" },
        { "Grid.ColumnSpan", "int" },
        { "Panel.ZIndex", "int" },
        { "Canvas.Left", "double" },
        { "Canvas.Top", "double" },
        { "Canvas.Right", "double" },
        { "Canvas.Bottom", "double" },
        { "DockPanel.Dock", "Avalonia.Controls.Dock" }
    };

    juce::String componentLabel(const CanonicalNode& node)
    {
        return node.name.isNotEmpty() ? node.name : node.targetType;
    }

    juce::String fieldNameFor(const juce::String& propertyName)
    {
        return "_" + Saekim::Core::toCamelCase(propertyName);
    }

    juce::String fieldInitializer(const juce::String& typeName)
    {
        if (typeName == "string")
            return " = string.Empty";
        if (typeName.startsWith("ObservableCollection<"))
            return " = new()";
        return {};
    }

    void collectHandlersRecursive(const std::vector<CanonicalNode>& nodes, std::vector<EventHandlerInfo>& handlers)
    {
        for (const auto& node : nodes)
        {
            for (const auto& eventName : node.events.getAllKeys())
            {
                const auto methodName = node.events[eventName];
                const auto seen = std::any_of(handlers.begin(),
                                              handlers.end(),
                                              [&methodName](const EventHandlerInfo& handler)
                                              {
                                                  return handler.methodName == methodName;
                                              });
                if (!seen)
                {
                    handlers.push_back({ methodName,
                                         eventName,
                                         Saekim::Companion::eventArgsTypeFor(eventName),
                                         componentLabel(node) });
                }
            }

            collectHandlersRecursive(node.children, handlers);
        }
    }

    void collectBindings(const juce::StringPairArray& pairs,
                         std::vector<BindingPropertyInfo>& properties,
                         juce::StringArray& commands)
    {
        for (const auto& key : pairs.getAllKeys())
        {
            const auto path = Saekim::Companion::bindingPath(pairs[key]);
            if (!path.has_value())
                continue;

            if (key == "Command")
            {
                if (path->endsWith("Command") && path->length() > 7)
                    commands.addIfNotAlreadyThere(path->dropLastCharacters(7));
                continue;
            }

            const auto seen = std::any_of(properties.begin(),
                                          properties.end(),
                                          [&path](const BindingPropertyInfo& property)
                                          {
                                              return property.name == *path;
                                          });
            if (!seen)
                properties.push_back({ *path, Saekim::Companion::inferPropertyType(key), key });
        }
    }

    void collectBindingsRecursive(const std::vector<CanonicalNode>& nodes,
                                  std::vector<BindingPropertyInfo>& properties,
                                  juce::StringArray& commands)
    {
        for (const auto& node : nodes)
        {
            collectBindings(node.attributes, properties, commands);
            collectBindings(node.attachedProperties, properties, commands);
            collectBindingsRecursive(node.children, properties, commands);
        }
    }
}

namespace Saekim::Companion
{
    std::vector<EventHandlerInfo> collectEventHandlers(const std::vector<CanonicalNode>& nodes)
    {
        std::vector<EventHandlerInfo> handlers;
        collectHandlersRecursive(nodes, handlers);
        return handlers;
    }

    std::vector<BindingPropertyInfo> collectBindingProperties(const std::vector<CanonicalNode>& nodes)
    {
        std::vector<BindingPropertyInfo> properties;
        juce::StringArray commands;
        collectBindingsRecursive(nodes, properties, commands);
        return properties;
    }

    juce::StringArray collectCommands(const std::vector<CanonicalNode>& nodes)
    {
        std::vector<BindingPropertyInfo> properties;
        juce::StringArray commands;
        collectBindingsRecursive(nodes, properties, commands);
        return commands;
    }

    std::optional<juce::String> bindingPath(const juce::String& value)
    {
        auto text = value.trim();
        if (text.startsWith("{Binding ") || text.startsWith("{Binding}"))
            text = text.substring(8);
        else if (text.startsWith("{CompiledBinding ") || text.startsWith("{CompiledBinding}"))
            text = text.substring(16);
        else
            return std::nullopt;

        if (!text.endsWith("}"))
            return std::nullopt;
        text = text.dropLastCharacters(1);

        // Top-level arguments only; nested markup extensions keep their commas.
        juce::StringArray arguments;
        juce::String current;
        int braceDepth = 0;
        for (int i = 0; i < text.length(); ++i)
        {
            const auto character = text[i];
            if (character == '{')
                ++braceDepth;
            else if (character == '}')
                --braceDepth;

            if (character == ',' && braceDepth == 0)
            {
                arguments.add(current.trim());
                current.clear();
                continue;
            }

            current += juce::String::charToString(character);
        }
        arguments.add(current.trim());

        juce::String path;
        for (const auto& argument : arguments)
        {
            if (argument.isEmpty())
                continue;

            const auto equals = argument.indexOfChar('=');
            if (equals < 0)
            {
                if (path.isEmpty())
                    path = argument;
                continue;
            }

            const auto key = argument.substring(0, equals).trim();
            if (key == "ElementName" || key == "RelativeSource" || key == "Source")
                return std::nullopt;
            if (key == "Path")
                path = argument.substring(equals + 1).trim();
        }

        // #element and $parent paths address the visual tree, not the view model.
        if (path.startsWithChar('#') || path.startsWithChar('$'))
            return std::nullopt;

        path = path.initialSectionContainingOnly("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_");
        if (path.isEmpty() || !Core::isAsciiAlpha(path[0]))
            return std::nullopt;

        return path;
    }

    juce::String eventArgsTypeFor(const juce::String& eventName)
    {
        if (eventName == "SelectionChanged")
            return "SelectionChangedEventArgs";
        if (eventName == "TextChanged")
            return "TextChangedEventArgs";
        return "RoutedEventArgs";
    }

    juce::String inferPropertyType(const juce::String& targetProperty)
    {
        for (const auto& rule : kTypeRules)
        {
            if (targetProperty == rule.targetProperty)
                return rule.typeName;
        }

        return "string";
    }

    CompanionSourceGenerator::CompanionSourceGenerator(ExportOptions optionsIn)
        : options(std::move(optionsIn))
    {
    }

    juce::String CompanionSourceGenerator::generateCompanionSource(const std::vector<CanonicalNode>& nodes,
                                                                   const juce::String& className,
                                                                   RootKind rootKind) const
    {
        const auto handlers = collectEventHandlers(nodes);
        const auto needsInteractivity = rootKind == RootKind::window
                                     || std::any_of(handlers.begin(),
                                                    handlers.end(),
                                                    [](const EventHandlerInfo& handler)
                                                    {
                                                        return handler.argsType == "RoutedEventArgs";
                                                    });

        Core::LineBuilder out(options.indentUnit());
        out.add("using Avalonia.Controls;");
        if (needsInteractivity)
            out.add("using Avalonia.Interactivity;");
        out.add("using Avalonia.Markup.Xaml;");
        if (options.includeViewModel)
            out.add("using " + options.rootNamespace + ".ViewModels;");
        out.addBlank();

        out.add("namespace " + options.rootNamespace);
        out.add("{");
        out.indent();

        out.add("public partial class " + className + " : " + rootKindToElement(rootKind));
        out.add("{");
        out.indent();

        out.add("public " + className + "()");
        out.add("{");
        out.indent();
        out.add("InitializeComponent();");
        if (options.includeViewModel)
            out.add("DataContext = new " + className + "ViewModel();");
        out.outdent();
        out.add("}");

        for (const auto& handler : handlers)
        {
            out.addBlank();
            if (options.includeComments)
            {
                out.add("/// <summary>");
                out.add("/// Handles " + handler.eventName + " for " + handler.component);
                out.add("/// </summary>");
            }

            out.add("private void " + handler.methodName + "(object? sender, " + handler.argsType + " e)");
            out.add("{");
            out.indent();
            out.add("// TODO: Implement " + handler.methodName);
            out.outdent();
            out.add("}");
        }

        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return out.toString() + "\n";
    }

    void CompanionSourceGenerator::appendProperty(Core::LineBuilder& out, const BindingPropertyInfo& property) const
    {
        const auto field = fieldNameFor(property.name);
        const auto declaration = "private " + property.typeName + " " + field + fieldInitializer(property.typeName) + ";";

        if (options.viewModelIdiom == ViewModelIdiom::communityToolkit)
        {
            out.add("[ObservableProperty]");
            out.add(declaration);
            return;
        }

        out.add(declaration);
        out.add("public " + property.typeName + " " + property.name);
        out.add("{");
        out.indent();
        out.add("get => " + field + ";");

        if (options.viewModelIdiom == ViewModelIdiom::reactiveUI)
        {
            out.add("set => this.RaiseAndSetIfChanged(ref " + field + ", value);");
        }
        else
        {
            out.add("set");
            out.add("{");
            out.indent();
            out.add("if (" + field + " != value)");
            out.add("{");
            out.indent();
            out.add(field + " = value;");
            out.add("OnPropertyChanged(nameof(" + property.name + "));");
            out.outdent();
            out.add("}");
            out.outdent();
            out.add("}");
        }

        out.outdent();
        out.add("}");
    }

    void CompanionSourceGenerator::appendCommand(Core::LineBuilder& out, const juce::String& commandName) const
    {
        switch (options.viewModelIdiom)
        {
            case ViewModelIdiom::communityToolkit:
                out.add("[RelayCommand]");
                out.add("private void " + commandName + "()");
                out.add("{");
                out.addAt(out.depth() + 1, "// TODO: Implement " + commandName);
                out.add("}");
                break;

            case ViewModelIdiom::reactiveUI:
                out.add("public ReactiveCommand<Unit, Unit> " + commandName + "Command { get; }");
                out.addBlank();
                out.add("private void Execute" + commandName + "()");
                out.add("{");
                out.addAt(out.depth() + 1, "// TODO: Implement " + commandName);
                out.add("}");
                break;

            case ViewModelIdiom::plain:
                out.add("public ICommand? " + commandName + "Command { get; }");
                out.addBlank();
                out.add("private void Execute" + commandName + "()");
                out.add("{");
                out.addAt(out.depth() + 1, "// TODO: Implement " + commandName);
                out.add("}");
                out.addBlank();
                out.add("private bool CanExecute" + commandName + "()");
                out.add("{");
                out.addAt(out.depth() + 1, "return true;");
                out.add("}");
                break;
        }
    }

    juce::String CompanionSourceGenerator::generateViewModelSource(const std::vector<CanonicalNode>& nodes,
                                                                   const juce::String& className) const
    {
        const auto viewModelName = className + "ViewModel";
        const auto properties = collectBindingProperties(nodes);
        const auto commands = collectCommands(nodes);

        Core::LineBuilder out(options.indentUnit());
        out.add("using System;");
        out.add("using System.Collections.ObjectModel;");
        out.add("using System.ComponentModel;");
        out.add("using System.Runtime.CompilerServices;");
        out.add("using System.Windows.Input;");

        if (options.viewModelIdiom == ViewModelIdiom::reactiveUI)
        {
            out.add("using System.Reactive;");
            out.add("using ReactiveUI;");
        }
        else if (options.viewModelIdiom == ViewModelIdiom::communityToolkit)
        {
            out.add("using CommunityToolkit.Mvvm.ComponentModel;");
            out.add("using CommunityToolkit.Mvvm.Input;");
        }

        out.addBlank();
        out.add("namespace " + options.rootNamespace + ".ViewModels");
        out.add("{");
        out.indent();

        switch (options.viewModelIdiom)
        {
            case ViewModelIdiom::plain:
                out.add("public class " + viewModelName + " : INotifyPropertyChanged");
                break;
            case ViewModelIdiom::reactiveUI:
                out.add("public class " + viewModelName + " : ReactiveObject");
                break;
            case ViewModelIdiom::communityToolkit:
                out.add("public partial class " + viewModelName + " : ObservableObject");
                break;
        }

        out.add("{");
        out.indent();

        out.add("public " + viewModelName + "()");
        out.add("{");
        out.indent();
        if (options.viewModelIdiom == ViewModelIdiom::reactiveUI)
        {
            for (const auto& command : commands)
                out.add(command + "Command = ReactiveCommand.Create(Execute" + command + ");");
        }
        else if (options.includeComments)
        {
            out.add("// Initialize commands and collections");
        }
        out.outdent();
        out.add("}");

        for (const auto& property : properties)
        {
            out.addBlank();
            appendProperty(out, property);
        }

        for (const auto& command : commands)
        {
            out.addBlank();
            appendCommand(out, command);
        }

        if (options.viewModelIdiom == ViewModelIdiom::plain)
        {
            out.addBlank();
            out.add("public event PropertyChangedEventHandler? PropertyChanged;");
            out.addBlank();
            out.add("protected virtual void OnPropertyChanged([CallerMemberName] string? propertyName = null)");
            out.add("{");
            out.addAt(out.depth() + 1, "PropertyChanged?.Invoke(this, new PropertyChangedEventArgs(propertyName));");
            out.add("}");
        }

        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return out.toString() + "\n";
    }

    juce::String CompanionSourceGenerator::generateValueConverter(const juce::String& converterName,
                                                                  const juce::String& sourceType,
                                                                  const juce::String& targetType) const
    {
        const auto name = Core::sanitizeIdentifier(converterName, "ValueConverter");

        Core::LineBuilder out(options.indentUnit());
        out.add("using System;");
        out.add("using System.Globalization;");
        out.add("using Avalonia;");
        out.add("using Avalonia.Data.Converters;");
        out.addBlank();
        out.add("namespace " + options.rootNamespace + ".Converters");
        out.add("{");
        out.indent();
        out.add("public class " + name + " : IValueConverter");
        out.add("{");
        out.indent();

        out.add("public object? Convert(object? value, Type targetType, object? parameter, CultureInfo culture)");
        out.add("{");
        out.indent();
        out.add("if (value is " + sourceType + " source)");
        out.add("{");
        out.addAt(out.depth() + 1, "// TODO: Convert " + sourceType + " to " + targetType);
        out.addAt(out.depth() + 1, "return default(" + targetType + ");");
        out.add("}");
        out.addBlank();
        out.add("return AvaloniaProperty.UnsetValue;");
        out.outdent();
        out.add("}");
        out.addBlank();

        out.add("public object? ConvertBack(object? value, Type targetType, object? parameter, CultureInfo culture)");
        out.add("{");
        out.addAt(out.depth() + 1, "throw new NotImplementedException();");
        out.add("}");

        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return out.toString() + "\n";
    }
}
