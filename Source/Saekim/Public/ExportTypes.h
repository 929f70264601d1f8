#pragma once

#include "Saekim/Public/Types.h"
#include <optional>
#include <vector>

namespace Saekim
{
    enum class RootKind
    {
        window,
        userControl,
        contentControl,
        page
    };

    enum class ViewModelIdiom
    {
        plain,
        reactiveUI,
        communityToolkit
    };

    enum class ExportPreset
    {
        document,
        window,
        userControl,
        project
    };

    enum class FileKind
    {
        markup,
        source,
        theme,
        project
    };

    enum class ExportStage
    {
        configuring,
        normalizing,
        generating,
        assembling,
        done,
        failed
    };

    juce::String rootKindToElement(RootKind kind);
    std::optional<RootKind> rootKindFromKey(const juce::String& key);
    juce::String viewModelIdiomToKey(ViewModelIdiom idiom);
    std::optional<ViewModelIdiom> viewModelIdiomFromKey(const juce::String& key);
    juce::String exportPresetToKey(ExportPreset preset);
    std::optional<ExportPreset> exportPresetFromKey(const juce::String& key);
    juce::String fileKindToKey(FileKind kind);
    juce::String exportStageToKey(ExportStage stage);

    struct ExportOptions
    {
        RootKind rootKind = RootKind::userControl;
        juce::String rootNamespace { "SaekimApp" };
        juce::String className { "ExportedView" };
        ExportPreset preset = ExportPreset::document;

        bool includeStyles = true;
        bool includeCodeBehind = false;
        bool includeViewModel = false;
        bool generateTheme = false;
        bool includeEffects = true;
        bool includeTransforms = true;
        bool includeGradients = true;
        bool includeDesignTimeData = true;
        bool includeComments = true;

        ViewModelIdiom viewModelIdiom = ViewModelIdiom::plain;
        juce::String bindingMode { "TwoWay" };

        int indentSize = 4;
        bool useTabs = false;

        // Keyed by palette name (e.g. "primary"), value is a colour string.
        juce::StringPairArray paletteOverrides { false };

        // Returns a copy with indentSize clamped and identifiers repaired.
        // Each adjustment is described in adjustmentsOut when provided.
        ExportOptions sanitised(juce::StringArray* adjustmentsOut = nullptr) const;

        juce::String indentUnit() const;
        juce::String themeFileName() const { return "AsciiTheme.axaml"; }
        juce::String viewModelClassName() const { return className + "ViewModel"; }
    };

    enum class IssueSeverity
    {
        info,
        warning,
        error
    };

    struct ExportIssue
    {
        IssueSeverity severity = IssueSeverity::info;
        juce::String message;
    };

    struct ExportReport
    {
        juce::String className { "ExportedView" };
        juce::String rootElement;
        juce::String rootNamespace;

        int nodeCount = 0;
        int supportedCount = 0;
        int unsupportedCount = 0;
        int convertedPropertyCount = 0;
        int skippedPropertyCount = 0;
        int fileCount = 0;
        int warningCount = 0;
        int errorCount = 0;

        std::vector<ExportIssue> issues;

        void addIssue(IssueSeverity severity, juce::String message);
        bool hasErrors() const noexcept;
        int countIssues(IssueSeverity severity) const noexcept;
        juce::String toText() const;
    };

    struct ExportedFile
    {
        juce::String fileName;
        juce::String content;
        FileKind kind = FileKind::markup;
    };

    struct ExportResult
    {
        bool success = false;
        ExportStage stage = ExportStage::configuring;
        std::vector<ExportedFile> files;
        juce::String primaryFileName;
        juce::String primaryContent;
        juce::String error;
        ExportReport report;

        const ExportedFile* findFile(const juce::String& fileName) const noexcept;
    };

    struct ExportPreview
    {
        int componentCount = 0;
        int supportedCount = 0;
        juce::StringArray unsupportedTypes;
        int estimatedFileCount = 1;
        juce::String rootElement;
        juce::String rootNamespace;
        juce::String className;
    };
}
