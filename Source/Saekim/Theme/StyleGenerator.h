#pragma once

#include "Saekim/Core/LineBuilder.h"
#include "Saekim/Public/ExportTypes.h"
#include <vector>

namespace Saekim::Theme
{
    struct PaletteEntry
    {
        juce::String name;
        juce::String color;
    };

    struct ThemeFonts
    {
        juce::String family { "Consolas, \"Courier New\", monospace" };
        juce::String sizeSmall { "11" };
        juce::String sizeNormal { "13" };
        juce::String sizeLarge { "16" };
        juce::String sizeHeader { "20" };
    };

    struct ThemePalette
    {
        std::vector<PaletteEntry> colors;
        ThemeFonts fonts;

        const PaletteEntry* find(const juce::String& name) const noexcept;

        // Keys are palette names ("primary") or font keys ("fontFamily", "fontSizeNormal", ...).
        // Unknown keys and unparseable colours are listed in rejectedOut and left unchanged.
        void applyOverrides(const juce::StringPairArray& overrides, juce::StringArray& rejectedOut);

        static ThemePalette makeDefault();
    };

    // Resource key for a palette name: "backgroundAlt" -> "BackgroundAlt".
    juce::String toResourceName(const juce::String& paletteName);

    struct StyleTarget
    {
        juce::String controlType;
        juce::String styleClass;
    };

    // Depth-first, first occurrence of each (controlType, styleClass) pair.
    std::vector<StyleTarget> collectStyleTargets(const std::vector<CanonicalNode>& nodes);

    class StyleGenerator
    {
    public:
        StyleGenerator(ThemePalette paletteIn, ExportOptions optionsIn);

        juce::String generateTheme(const std::vector<StyleTarget>& extraStyleTargets = {}) const;

        // Catalog group for Button, TextBox, ComboBox, ListBox, TabControl and Border;
        // a FontFamily-only block for anything else.
        juce::String generateControlStyle(const juce::String& controlType, const juce::String& styleClass = {}) const;

        bool catalogCovers(const StyleTarget& target) const;

        const ThemePalette& palette() const noexcept { return themePalette; }

    private:
        struct Setter
        {
            juce::String property;
            juce::String value;
        };

        struct Block
        {
            juce::String selector;
            std::vector<Setter> setters;
        };

        struct Group
        {
            juce::String controlType;
            juce::String title;
            std::vector<Block> blocks;
        };

        std::vector<Group> buildCatalog() const;
        void appendGroup(Core::LineBuilder& out, const Group& group, int level) const;
        void appendBlock(Core::LineBuilder& out, const Block& block, int level) const;
        Block fallbackBlock(const StyleTarget& target) const;

        ThemePalette themePalette;
        ExportOptions options;
        std::vector<Group> catalog;
    };
}
