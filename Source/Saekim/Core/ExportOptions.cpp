#include "Saekim/Public/ExportTypes.h"

#include "Saekim/Core/Identifiers.h"
#include "Saekim/Core/LineBuilder.h"

namespace Saekim
{
    juce::String rootKindToElement(RootKind kind)
    {
        switch (kind)
        {
            case RootKind::window: return "Window";
            case RootKind::userControl: return "UserControl";
            case RootKind::contentControl: return "ContentControl";
            case RootKind::page: return "Page";
        }

        return "UserControl";
    }

    std::optional<RootKind> rootKindFromKey(const juce::String& key)
    {
        const auto normalized = key.trim().toLowerCase().removeCharacters("-_ ");
        if (normalized == "window") return RootKind::window;
        if (normalized == "usercontrol") return RootKind::userControl;
        if (normalized == "contentcontrol") return RootKind::contentControl;
        if (normalized == "page") return RootKind::page;
        return std::nullopt;
    }

    juce::String viewModelIdiomToKey(ViewModelIdiom idiom)
    {
        switch (idiom)
        {
            case ViewModelIdiom::plain: return "plain";
            case ViewModelIdiom::reactiveUI: return "reactiveui";
            case ViewModelIdiom::communityToolkit: return "communitytoolkit";
        }

        return "plain";
    }

    std::optional<ViewModelIdiom> viewModelIdiomFromKey(const juce::String& key)
    {
        const auto normalized = key.trim().toLowerCase().removeCharacters("-_ .");
        if (normalized == "plain" || normalized == "inotifypropertychanged") return ViewModelIdiom::plain;
        if (normalized == "reactiveui" || normalized == "reactive") return ViewModelIdiom::reactiveUI;
        if (normalized == "communitytoolkit" || normalized == "communitytoolkitmvvm" || normalized == "mvvmtoolkit")
            return ViewModelIdiom::communityToolkit;
        return std::nullopt;
    }

    juce::String exportPresetToKey(ExportPreset preset)
    {
        switch (preset)
        {
            case ExportPreset::document: return "document";
            case ExportPreset::window: return "window";
            case ExportPreset::userControl: return "usercontrol";
            case ExportPreset::project: return "project";
        }

        return "document";
    }

    std::optional<ExportPreset> exportPresetFromKey(const juce::String& key)
    {
        const auto normalized = key.trim().toLowerCase().removeCharacters("-_ ");
        if (normalized == "document") return ExportPreset::document;
        if (normalized == "window") return ExportPreset::window;
        if (normalized == "usercontrol") return ExportPreset::userControl;
        if (normalized == "project") return ExportPreset::project;
        return std::nullopt;
    }

    juce::String fileKindToKey(FileKind kind)
    {
        switch (kind)
        {
            case FileKind::markup: return "markup";
            case FileKind::source: return "source";
            case FileKind::theme: return "theme";
            case FileKind::project: return "project";
        }

        return "markup";
    }

    juce::String exportStageToKey(ExportStage stage)
    {
        switch (stage)
        {
            case ExportStage::configuring: return "configuring";
            case ExportStage::normalizing: return "normalizing";
            case ExportStage::generating: return "generating";
            case ExportStage::assembling: return "assembling";
            case ExportStage::done: return "done";
            case ExportStage::failed: return "failed";
        }

        return "failed";
    }

    ExportOptions ExportOptions::sanitised(juce::StringArray* adjustmentsOut) const
    {
        auto copy = *this;

        const auto note = [adjustmentsOut](const juce::String& message)
        {
            if (adjustmentsOut != nullptr)
                adjustmentsOut->add(message);
        };

        const auto clampedIndent = juce::jlimit(1, 8, indentSize);
        if (clampedIndent != indentSize)
        {
            note("indentSize " + juce::String(indentSize) + " clamped to " + juce::String(clampedIndent));
            copy.indentSize = clampedIndent;
        }

        const auto safeClassName = Core::sanitizeIdentifier(className, "ExportedView");
        if (safeClassName != className)
        {
            note("className '" + className + "' sanitized to '" + safeClassName + "'");
            copy.className = safeClassName;
        }

        const auto safeNamespace = Core::sanitizeNamespace(rootNamespace, "SaekimApp");
        if (safeNamespace != rootNamespace)
        {
            note("rootNamespace '" + rootNamespace + "' sanitized to '" + safeNamespace + "'");
            copy.rootNamespace = safeNamespace;
        }

        const auto mode = bindingMode.trim();
        const juce::StringArray knownModes { "Default", "OneWay", "TwoWay", "OneTime", "OneWayToSource" };
        if (!knownModes.contains(mode))
        {
            note("bindingMode '" + bindingMode + "' is not recognised, using TwoWay");
            copy.bindingMode = "TwoWay";
        }
        else
        {
            copy.bindingMode = mode;
        }

        return copy;
    }

    juce::String ExportOptions::indentUnit() const
    {
        return Core::LineBuilder::makeIndentUnit(indentSize, useTabs);
    }
}
