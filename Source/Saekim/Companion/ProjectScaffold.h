#pragma once

#include "Saekim/Public/ExportTypes.h"
#include <vector>

namespace Saekim::Companion
{
    constexpr const char* kAvaloniaPackageVersion = "11.1.0";
    constexpr const char* kCommunityToolkitPackageVersion = "8.2.2";

    // Desktop application skeleton hosting the exported view:
    // {NS}.csproj, Program.cs, App.axaml(.cs), ViewModels/*, Views/MainWindow.axaml(.cs).
    std::vector<ExportedFile> generateProjectScaffold(const ExportOptions& options);

    juce::String generateProjectFile(const ExportOptions& options);
    juce::String generateProgramSource(const ExportOptions& options);
    juce::String generateApplicationMarkup(const ExportOptions& options);
    juce::String generateApplicationSource(const ExportOptions& options);
    juce::String generateViewModelBase(const ExportOptions& options);
    juce::String generateMainWindowViewModel(const ExportOptions& options);
    juce::String generateMainWindowMarkup(const ExportOptions& options);
    juce::String generateMainWindowSource(const ExportOptions& options);
}
