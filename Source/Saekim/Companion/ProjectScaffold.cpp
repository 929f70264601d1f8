#include "Saekim/Companion/ProjectScaffold.h"

#include "Saekim/Core/LineBuilder.h"
#include "Saekim/Core/XmlText.h"

namespace
{
    juce::String finish(const Saekim::Core::LineBuilder& out)
    {
        return out.toString() + "\n";
    }
}

namespace Saekim::Companion
{
    juce::String generateProjectFile(const ExportOptions& options)
    {
        const juce::String avalonia(kAvaloniaPackageVersion);

        Core::LineBuilder out("  ");
        out.add("<Project Sdk=\"Microsoft.NET.Sdk\">");
        out.addAt(1, "<PropertyGroup>");
        out.addAt(2, "<OutputType>WinExe</OutputType>");
        out.addAt(2, "<TargetFramework>net8.0</TargetFramework>");
        out.addAt(2, "<Nullable>enable</Nullable>");
        out.addAt(2, "<RootNamespace>" + options.rootNamespace + "</RootNamespace>");
        out.addAt(2, "<BuiltInComInteropSupport>true</BuiltInComInteropSupport>");
        out.addAt(1, "</PropertyGroup>");
        out.addBlank();
        out.addAt(1, "<ItemGroup>");
        out.addAt(2, "<PackageReference Include=\"Avalonia\" Version=\"" + avalonia + "\" />");
        out.addAt(2, "<PackageReference Include=\"Avalonia.Desktop\" Version=\"" + avalonia + "\" />");
        out.addAt(2, "<PackageReference Include=\"Avalonia.Themes.Fluent\" Version=\"" + avalonia + "\" />");
        out.addAt(2, "<PackageReference Include=\"Avalonia.Fonts.Inter\" Version=\"" + avalonia + "\" />");

        if (options.viewModelIdiom == ViewModelIdiom::reactiveUI)
            out.addAt(2, "<PackageReference Include=\"Avalonia.ReactiveUI\" Version=\"" + avalonia + "\" />");
        if (options.viewModelIdiom == ViewModelIdiom::communityToolkit)
            out.addAt(2, "<PackageReference Include=\"CommunityToolkit.Mvvm\" Version=\"" + juce::String(kCommunityToolkitPackageVersion) + "\" />");

        out.addAt(1, "</ItemGroup>");
        out.add("</Project>");
        return finish(out);
    }

    juce::String generateProgramSource(const ExportOptions& options)
    {
        const auto reactive = options.viewModelIdiom == ViewModelIdiom::reactiveUI;

        Core::LineBuilder out(options.indentUnit());
        out.add("using System;");
        out.add("using Avalonia;");
        if (reactive)
            out.add("using Avalonia.ReactiveUI;");
        out.addBlank();
        out.add("namespace " + options.rootNamespace);
        out.add("{");
        out.indent();
        out.add("internal sealed class Program");
        out.add("{");
        out.indent();
        out.add("[STAThread]");
        out.add("public static void Main(string[] args) => BuildAvaloniaApp()");
        out.addAt(out.depth() + 1, ".StartWithClassicDesktopLifetime(args);");
        out.addBlank();
        out.add("public static AppBuilder BuildAvaloniaApp()");
        out.addAt(out.depth() + 1, "=> AppBuilder.Configure<App>()");
        out.addAt(out.depth() + 2, ".UsePlatformDetect()");
        out.addAt(out.depth() + 2, ".WithInterFont()");
        out.addAt(out.depth() + 2, reactive ? ".LogToTrace()" : ".LogToTrace();");
        if (reactive)
            out.addAt(out.depth() + 2, ".UseReactiveUI();");
        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return finish(out);
    }

    juce::String generateApplicationMarkup(const ExportOptions& options)
    {
        Core::LineBuilder out(options.indentUnit());
        out.add("<Application");
        out.addAt(1, "xmlns=\"https://github.com/avaloniaui\"");
        out.addAt(1, "xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"");
        out.addAt(1, "x:Class=\"" + options.rootNamespace + ".App\"");
        out.addAt(1, "RequestedThemeVariant=\"Dark\">");
        out.addBlank();
        out.addAt(1, "<Application.Styles>");
        out.addAt(2, "<FluentTheme />");
        if (options.generateTheme)
            out.addAt(2, "<StyleInclude Source=\"avares://" + options.rootNamespace + "/" + options.themeFileName() + "\" />");
        out.addAt(1, "</Application.Styles>");
        out.add("</Application>");
        return finish(out);
    }

    juce::String generateApplicationSource(const ExportOptions& options)
    {
        Core::LineBuilder out(options.indentUnit());
        out.add("using Avalonia;");
        out.add("using Avalonia.Controls.ApplicationLifetimes;");
        out.add("using Avalonia.Markup.Xaml;");
        out.add("using " + options.rootNamespace + ".Views;");
        out.addBlank();
        out.add("namespace " + options.rootNamespace);
        out.add("{");
        out.indent();
        out.add("public partial class App : Application");
        out.add("{");
        out.indent();
        out.add("public override void Initialize()");
        out.add("{");
        out.addAt(out.depth() + 1, "AvaloniaXamlLoader.Load(this);");
        out.add("}");
        out.addBlank();
        out.add("public override void OnFrameworkInitializationCompleted()");
        out.add("{");
        out.indent();
        out.add("if (ApplicationLifetime is IClassicDesktopStyleApplicationLifetime desktop)");
        out.add("{");
        out.addAt(out.depth() + 1, "desktop.MainWindow = new MainWindow();");
        out.add("}");
        out.addBlank();
        out.add("base.OnFrameworkInitializationCompleted();");
        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return finish(out);
    }

    juce::String generateViewModelBase(const ExportOptions& options)
    {
        Core::LineBuilder out(options.indentUnit());

        switch (options.viewModelIdiom)
        {
            case ViewModelIdiom::reactiveUI:
                out.add("using ReactiveUI;");
                break;
            case ViewModelIdiom::communityToolkit:
                out.add("using CommunityToolkit.Mvvm.ComponentModel;");
                break;
            case ViewModelIdiom::plain:
                out.add("using System.Collections.Generic;");
                out.add("using System.ComponentModel;");
                out.add("using System.Runtime.CompilerServices;");
                break;
        }

        out.addBlank();
        out.add("namespace " + options.rootNamespace + ".ViewModels");
        out.add("{");
        out.indent();

        if (options.viewModelIdiom == ViewModelIdiom::reactiveUI)
        {
            out.add("public class ViewModelBase : ReactiveObject");
            out.add("{");
            out.add("}");
        }
        else if (options.viewModelIdiom == ViewModelIdiom::communityToolkit)
        {
            out.add("public class ViewModelBase : ObservableObject");
            out.add("{");
            out.add("}");
        }
        else
        {
            out.add("public class ViewModelBase : INotifyPropertyChanged");
            out.add("{");
            out.indent();
            out.add("public event PropertyChangedEventHandler? PropertyChanged;");
            out.addBlank();
            out.add("protected virtual void OnPropertyChanged([CallerMemberName] string? propertyName = null)");
            out.add("{");
            out.addAt(out.depth() + 1, "PropertyChanged?.Invoke(this, new PropertyChangedEventArgs(propertyName));");
            out.add("}");
            out.addBlank();
            out.add("protected bool SetProperty<T>(ref T field, T value, [CallerMemberName] string? propertyName = null)");
            out.add("{");
            out.indent();
            out.add("if (EqualityComparer<T>.Default.Equals(field, value))");
            out.addAt(out.depth() + 1, "return false;");
            out.addBlank();
            out.add("field = value;");
            out.add("OnPropertyChanged(propertyName);");
            out.add("return true;");
            out.outdent();
            out.add("}");
            out.outdent();
            out.add("}");
        }

        out.outdent();
        out.add("}");
        return finish(out);
    }

    juce::String generateMainWindowViewModel(const ExportOptions& options)
    {
        Core::LineBuilder out(options.indentUnit());
        out.add("namespace " + options.rootNamespace + ".ViewModels");
        out.add("{");
        out.indent();
        out.add("public class MainWindowViewModel : ViewModelBase");
        out.add("{");
        out.indent();
        out.add("public string Title { get; } = \"" + options.rootNamespace + "\";");
        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return finish(out);
    }

    juce::String generateMainWindowMarkup(const ExportOptions& options)
    {
        Core::LineBuilder out(options.indentUnit());
        out.add("<Window");
        out.addAt(1, "xmlns=\"https://github.com/avaloniaui\"");
        out.addAt(1, "xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"");
        out.addAt(1, "xmlns:local=\"clr-namespace:" + options.rootNamespace + "\"");
        out.addAt(1, "x:Class=\"" + options.rootNamespace + ".Views.MainWindow\"");
        out.addAt(1, Core::xmlAttribute("Title", options.rootNamespace));
        out.addAt(1, "Width=\"800\"");
        out.addAt(1, "Height=\"600\">");
        out.addBlank();
        out.addAt(1, "<local:" + options.className + " />");
        out.add("</Window>");
        return finish(out);
    }

    juce::String generateMainWindowSource(const ExportOptions& options)
    {
        Core::LineBuilder out(options.indentUnit());
        out.add("using Avalonia.Controls;");
        out.add("using " + options.rootNamespace + ".ViewModels;");
        out.addBlank();
        out.add("namespace " + options.rootNamespace + ".Views");
        out.add("{");
        out.indent();
        out.add("public partial class MainWindow : Window");
        out.add("{");
        out.indent();
        out.add("public MainWindow()");
        out.add("{");
        out.indent();
        out.add("InitializeComponent();");
        out.add("DataContext = new MainWindowViewModel();");
        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        out.outdent();
        out.add("}");
        return finish(out);
    }

    std::vector<ExportedFile> generateProjectScaffold(const ExportOptions& options)
    {
        return {
            { options.rootNamespace + ".csproj", generateProjectFile(options), FileKind::project },
            { "Program.cs", generateProgramSource(options), FileKind::project },
            { "App.axaml", generateApplicationMarkup(options), FileKind::project },
            { "App.axaml.cs", generateApplicationSource(options), FileKind::project },
            { "ViewModels/ViewModelBase.cs", generateViewModelBase(options), FileKind::project },
            { "ViewModels/MainWindowViewModel.cs", generateMainWindowViewModel(options), FileKind::project },
            { "Views/MainWindow.axaml", generateMainWindowMarkup(options), FileKind::project },
            { "Views/MainWindow.axaml.cs", generateMainWindowSource(options), FileKind::project }
        };
    }
}
