#include "Saekim/Theme/StyleGenerator.h"

#include "Saekim/Convert/ValueConverters.h"
#include "Saekim/Core/XmlText.h"
#include <algorithm>

namespace
{
    juce::String dynamicResource(const char* name)
    {
        return "{DynamicResource " + juce::String(name) + "}";
    }

    void collectTargetsRecursive(const std::vector<Saekim::CanonicalNode>& nodes,
                                 std::vector<Saekim::Theme::StyleTarget>& targets)
    {
        for (const auto& node : nodes)
        {
            if (node.styleClass.isNotEmpty())
            {
                const auto seen = std::any_of(targets.begin(),
                                              targets.end(),
                                              [&node](const Saekim::Theme::StyleTarget& target)
                                              {
                                                  return target.controlType == node.targetType
                                                      && target.styleClass == node.styleClass;
                                              });
                if (!seen)
                    targets.push_back({ node.targetType, node.styleClass });
            }

            collectTargetsRecursive(node.children, targets);
        }
    }
}

namespace Saekim::Theme
{
    const PaletteEntry* ThemePalette::find(const juce::String& name) const noexcept
    {
        const auto it = std::find_if(colors.begin(),
                                     colors.end(),
                                     [&name](const PaletteEntry& entry)
                                     {
                                         return entry.name.equalsIgnoreCase(name);
                                     });
        return it == colors.end() ? nullptr : &(*it);
    }

    void ThemePalette::applyOverrides(const juce::StringPairArray& overrides, juce::StringArray& rejectedOut)
    {
        for (const auto& key : overrides.getAllKeys())
        {
            const auto value = overrides[key].trim();

            juce::String* fontSlot = nullptr;
            if (key == "fontFamily") fontSlot = &fonts.family;
            else if (key == "fontSizeSmall") fontSlot = &fonts.sizeSmall;
            else if (key == "fontSizeNormal") fontSlot = &fonts.sizeNormal;
            else if (key == "fontSizeLarge") fontSlot = &fonts.sizeLarge;
            else if (key == "fontSizeHeader") fontSlot = &fonts.sizeHeader;

            if (fontSlot != nullptr)
            {
                if (value.isEmpty())
                    rejectedOut.add(key);
                else
                    *fontSlot = value;
                continue;
            }

            const auto it = std::find_if(colors.begin(),
                                         colors.end(),
                                         [&key](const PaletteEntry& entry)
                                         {
                                             return entry.name.equalsIgnoreCase(key);
                                         });
            const auto color = Convert::colorToHex(juce::var(value));

            if (it == colors.end() || !color.has_value())
            {
                rejectedOut.add(key);
                continue;
            }

            it->color = *color;
        }
    }

    ThemePalette ThemePalette::makeDefault()
    {
        ThemePalette palette;
        palette.colors = {
            { "background", "#1E1E1E" },
            { "backgroundAlt", "#252526" },
            { "foreground", "#D4D4D4" },
            { "foregroundDim", "#808080" },

            { "asciiGreen", "#00FF00" },
            { "asciiAmber", "#FFB000" },
            { "asciiCyan", "#00FFFF" },
            { "asciiWhite", "#FFFFFF" },
            { "asciiGray", "#888888" },

            { "primary", "#007ACC" },
            { "secondary", "#68217A" },
            { "accent", "#00CC6A" },
            { "warning", "#CE9178" },
            { "error", "#F14C4C" },

            { "border", "#3E3E42" },
            { "borderHover", "#007ACC" },
            { "borderFocus", "#007ACC" },

            { "hover", "#2A2D2E" },
            { "pressed", "#094771" },
            { "selected", "#0E639C" },
            { "disabled", "#5A5A5A" }
        };
        return palette;
    }

    juce::String toResourceName(const juce::String& paletteName)
    {
        if (paletteName.isEmpty())
            return {};
        return paletteName.substring(0, 1).toUpperCase() + paletteName.substring(1);
    }

    std::vector<StyleTarget> collectStyleTargets(const std::vector<CanonicalNode>& nodes)
    {
        std::vector<StyleTarget> targets;
        collectTargetsRecursive(nodes, targets);
        return targets;
    }

    StyleGenerator::StyleGenerator(ThemePalette paletteIn, ExportOptions optionsIn)
        : themePalette(std::move(paletteIn)),
          options(std::move(optionsIn))
    {
        catalog = buildCatalog();
    }

    std::vector<StyleGenerator::Group> StyleGenerator::buildCatalog() const
    {
        const auto& fonts = themePalette.fonts;
        std::vector<Group> groups;

        groups.push_back({ "Button", "Button Styles", {
            { "Button.AsciiButton", {
                { "Background", dynamicResource("BackgroundAlt") },
                { "Foreground", dynamicResource("Foreground") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "Padding", "12,6" },
                { "FontFamily", fonts.family },
                { "CornerRadius", "2" } } },
            { "Button.AsciiButton:pointerover", {
                { "Background", dynamicResource("Hover") },
                { "BorderBrush", dynamicResource("BorderHover") } } },
            { "Button.AsciiButton:pressed", {
                { "Background", dynamicResource("Pressed") } } },
            { "Button.AsciiPrimaryButton", {
                { "Background", dynamicResource("Primary") },
                { "Foreground", dynamicResource("AsciiWhite") },
                { "BorderThickness", "0" },
                { "Padding", "16,8" },
                { "FontFamily", fonts.family },
                { "FontWeight", "SemiBold" },
                { "CornerRadius", "2" } } }
        } });

        groups.push_back({ "TextBox", "TextBox Styles", {
            { "TextBox.AsciiTextBox", {
                { "Background", dynamicResource("Background") },
                { "Foreground", dynamicResource("Foreground") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "Padding", "8,4" },
                { "FontFamily", fonts.family },
                { "FontSize", fonts.sizeNormal },
                { "CornerRadius", "2" },
                { "CaretBrush", dynamicResource("AsciiGreen") },
                { "SelectionBrush", dynamicResource("Selected") } } },
            { "TextBox.AsciiTextBox:focus", {
                { "BorderBrush", dynamicResource("BorderFocus") } } },
            { "TextBox.AsciiCodeInput", {
                { "Background", dynamicResource("Background") },
                { "Foreground", dynamicResource("AsciiGreen") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "Padding", "12,8" },
                { "FontFamily", fonts.family },
                { "FontSize", fonts.sizeNormal },
                { "AcceptsReturn", "True" },
                { "TextWrapping", "NoWrap" } } }
        } });

        groups.push_back({ "ComboBox", "ComboBox Styles", {
            { "ComboBox.AsciiComboBox", {
                { "Background", dynamicResource("BackgroundAlt") },
                { "Foreground", dynamicResource("Foreground") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "Padding", "8,4" },
                { "FontFamily", fonts.family },
                { "CornerRadius", "2" } } },
            { "ComboBox.AsciiComboBox:pointerover", {
                { "BorderBrush", dynamicResource("BorderHover") } } }
        } });

        groups.push_back({ "ListBox", "ListBox Styles", {
            { "ListBox.AsciiListBox", {
                { "Background", dynamicResource("Background") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "Padding", "2" },
                { "CornerRadius", "2" } } },
            { "ListBoxItem.AsciiListBoxItem", {
                { "Padding", "8,4" },
                { "FontFamily", fonts.family },
                { "Foreground", dynamicResource("Foreground") } } },
            { "ListBoxItem.AsciiListBoxItem:pointerover", {
                { "Background", dynamicResource("Hover") } } },
            { "ListBoxItem.AsciiListBoxItem:selected", {
                { "Background", dynamicResource("Selected") } } }
        } });

        groups.push_back({ "Border", "Panel Styles", {
            { "Border.AsciiPanel", {
                { "Background", dynamicResource("BackgroundAlt") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "CornerRadius", "4" },
                { "Padding", "12" } } },
            { "Border.AsciiHeaderPanel", {
                { "Background", dynamicResource("Primary") },
                { "Padding", "16,8" },
                { "CornerRadius", "4,4,0,0" } } },
            { "Border.AsciiCard", {
                { "Background", dynamicResource("BackgroundAlt") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "CornerRadius", "4" },
                { "Padding", "16" },
                { "BoxShadow", "0 2 8 0 #40000000" } } }
        } });

        groups.push_back({ "TabControl", "TabControl Styles", {
            { "TabControl.AsciiTabControl", {
                { "Background", dynamicResource("Background") },
                { "Padding", "0" } } },
            { "TabItem.AsciiTabItem", {
                { "Background", "Transparent" },
                { "Foreground", dynamicResource("ForegroundDim") },
                { "Padding", "16,8" },
                { "FontFamily", fonts.family } } },
            { "TabItem.AsciiTabItem:pointerover", {
                { "Background", dynamicResource("Hover") },
                { "Foreground", dynamicResource("Foreground") } } },
            { "TabItem.AsciiTabItem:selected", {
                { "Background", dynamicResource("BackgroundAlt") },
                { "Foreground", dynamicResource("Foreground") },
                { "BorderBrush", dynamicResource("Primary") },
                { "BorderThickness", "0,0,0,2" } } }
        } });

        // Not addressable through generateControlStyle().
        groups.push_back({ {}, "ASCII Art Display Styles", {
            { "Border.AsciiArtContainer", {
                { "Background", dynamicResource("Background") },
                { "BorderBrush", dynamicResource("Border") },
                { "BorderThickness", "1" },
                { "CornerRadius", "2" },
                { "Padding", "8" } } },
            { "TextBlock.AsciiArt", {
                { "FontFamily", fonts.family },
                { "FontSize", fonts.sizeNormal },
                { "Foreground", dynamicResource("AsciiGreen") },
                { "TextWrapping", "NoWrap" } } },
            { "Canvas.AsciiCanvas", {
                { "Background", dynamicResource("Background") },
                { "ClipToBounds", "True" } } }
        } });

        return groups;
    }

    void StyleGenerator::appendBlock(Core::LineBuilder& out, const Block& block, int level) const
    {
        out.addAt(level, "<Style Selector=\"" + Core::escapeXml(block.selector) + "\">");
        for (const auto& setter : block.setters)
        {
            out.addAt(level + 1, "<Setter Property=\"" + setter.property + "\" Value=\""
                                     + Core::escapeMarkupValue(setter.value) + "\" />");
        }
        out.addAt(level, "</Style>");
    }

    void StyleGenerator::appendGroup(Core::LineBuilder& out, const Group& group, int level) const
    {
        if (options.includeComments)
            out.addAt(level, "<!-- " + group.title + " -->");

        for (size_t i = 0; i < group.blocks.size(); ++i)
        {
            if (i > 0)
                out.addBlank();
            appendBlock(out, group.blocks[i], level);
        }
    }

    StyleGenerator::Block StyleGenerator::fallbackBlock(const StyleTarget& target) const
    {
        const auto styleClass = target.styleClass.isNotEmpty() ? target.styleClass : "Ascii" + target.controlType;
        return { target.controlType + "." + styleClass, { { "FontFamily", themePalette.fonts.family } } };
    }

    bool StyleGenerator::catalogCovers(const StyleTarget& target) const
    {
        const auto selector = target.controlType + "." + target.styleClass;
        for (const auto& group : catalog)
        {
            for (const auto& block : group.blocks)
            {
                if (block.selector == selector)
                    return true;
            }
        }

        return false;
    }

    juce::String StyleGenerator::generateTheme(const std::vector<StyleTarget>& extraStyleTargets) const
    {
        Core::LineBuilder out(options.indentUnit());
        out.add("<?xml version=\"1.0\" encoding=\"utf-8\"?>");
        out.add("<ResourceDictionary");
        out.addAt(1, "xmlns=\"https://github.com/avaloniaui\"");
        out.addAt(1, "xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\">");
        out.addBlank();

        if (options.includeComments)
            out.addAt(1, "<!-- Color Resources -->");
        for (const auto& entry : themePalette.colors)
            out.addAt(1, "<Color x:Key=\"" + toResourceName(entry.name) + "Color\">" + Core::escapeXml(entry.color) + "</Color>");
        out.addBlank();

        if (options.includeComments)
            out.addAt(1, "<!-- Brush Resources -->");
        for (const auto& entry : themePalette.colors)
        {
            const auto name = toResourceName(entry.name);
            out.addAt(1, "<SolidColorBrush x:Key=\"" + name + "\" Color=\"{StaticResource " + name + "Color}\" />");
        }

        for (const auto& group : catalog)
        {
            out.addBlank();
            appendGroup(out, group, 1);
        }

        std::vector<StyleTarget> missing;
        for (const auto& target : extraStyleTargets)
        {
            if (target.controlType.isEmpty() || catalogCovers(target))
                continue;

            const auto duplicate = std::any_of(missing.begin(),
                                               missing.end(),
                                               [&target](const StyleTarget& other)
                                               {
                                                   return other.controlType == target.controlType
                                                       && other.styleClass == target.styleClass;
                                               });
            if (!duplicate)
                missing.push_back(target);
        }

        if (!missing.empty())
        {
            out.addBlank();
            if (options.includeComments)
                out.addAt(1, "<!-- Component Styles -->");

            for (size_t i = 0; i < missing.size(); ++i)
            {
                if (i > 0)
                    out.addBlank();
                appendBlock(out, fallbackBlock(missing[i]), 1);
            }
        }

        out.addBlank();
        out.add("</ResourceDictionary>");
        return out.toString() + "\n";
    }

    juce::String StyleGenerator::generateControlStyle(const juce::String& controlType, const juce::String& styleClass) const
    {
        Core::LineBuilder out(options.indentUnit());

        const auto it = std::find_if(catalog.begin(),
                                     catalog.end(),
                                     [&controlType](const Group& group)
                                     {
                                         return group.controlType.isNotEmpty() && group.controlType == controlType;
                                     });

        if (it != catalog.end())
            appendGroup(out, *it, 0);
        else
            appendBlock(out, fallbackBlock({ controlType, styleClass }), 0);

        return out.toString();
    }
}
