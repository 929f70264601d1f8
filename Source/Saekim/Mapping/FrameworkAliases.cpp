#include "Saekim/Mapping/FrameworkAliases.h"

#include "Saekim/Core/Identifiers.h"
#include <algorithm>

namespace
{
    using Saekim::Convert::ConverterKind;
    using Saekim::Mapping::ComponentAlias;
    using Saekim::Mapping::PropertyAlias;

    ComponentAlias alias(const char* componentType,
                         const char* targetElement,
                         const char* preferredSourceType = "",
                         const char* styleClass = "")
    {
        ComponentAlias entry;
        entry.componentType = componentType;
        entry.targetElement = targetElement;
        entry.preferredSourceType = preferredSourceType;
        entry.styleClass = styleClass;
        return entry;
    }

    ComponentAlias withFixed(ComponentAlias entry, const char* name, const char* value)
    {
        entry.fixedAttributes.set(name, value);
        return entry;
    }
}

namespace Saekim::Mapping
{
    bool FrameworkAliasRegistry::registerAlias(ComponentAlias alias)
    {
        alias.componentType = alias.componentType.trim();
        alias.targetElement = alias.targetElement.trim();

        if (alias.componentType.isEmpty() || alias.targetElement.isEmpty())
            return false;
        if (findComponent(alias.componentType) != nullptr)
            return false;

        componentAliases.push_back(std::move(alias));
        return true;
    }

    bool FrameworkAliasRegistry::registerPropertyAlias(PropertyAlias alias)
    {
        if (alias.source.trim().isEmpty() || alias.target.trim().isEmpty())
            return false;
        if (findProperty(alias.source) != nullptr)
            return false;

        propertyAliases.push_back(std::move(alias));
        return true;
    }

    const ComponentAlias* FrameworkAliasRegistry::findComponent(const juce::String& componentType) const noexcept
    {
        const auto key = componentType.trim();
        const auto it = std::find_if(componentAliases.begin(),
                                     componentAliases.end(),
                                     [&key](const ComponentAlias& entry)
                                     {
                                         return entry.componentType.equalsIgnoreCase(key);
                                     });
        return it == componentAliases.end() ? nullptr : &(*it);
    }

    const PropertyAlias* FrameworkAliasRegistry::findProperty(const juce::String& source) const noexcept
    {
        const auto it = std::find_if(propertyAliases.begin(),
                                     propertyAliases.end(),
                                     [&source](const PropertyAlias& entry)
                                     {
                                         return entry.source == source;
                                     });
        return it == propertyAliases.end() ? nullptr : &(*it);
    }

    juce::String FrameworkAliasRegistry::translatePropertyName(const juce::String& source) const
    {
        if (const auto* entry = findProperty(source))
            return entry->target;

        return Core::toPascalCase(source);
    }

    FrameworkAliasRegistry makeDefaultFrameworkAliasRegistry()
    {
        FrameworkAliasRegistry registry;
        using K = ConverterKind;

        const PropertyAlias propertyTable[] = {
            { "name", "Name", K::string },
            { "isEnabled", "IsEnabled", K::boolean },
            { "isVisible", "IsVisible", K::boolean },
            { "opacity", "Opacity", K::number },
            { "tooltip", "ToolTip.Tip", K::string },
            { "cursor", "Cursor", K::string },
            { "focusable", "Focusable", K::boolean },
            { "isTabStop", "IsTabStop", K::boolean },
            { "tabIndex", "TabIndex", K::integer },
            { "width", "Width", K::dimension },
            { "height", "Height", K::dimension },
            { "minWidth", "MinWidth", K::dimension },
            { "minHeight", "MinHeight", K::dimension },
            { "maxWidth", "MaxWidth", K::dimension },
            { "maxHeight", "MaxHeight", K::dimension },
            { "margin", "Margin", K::thickness },
            { "padding", "Padding", K::thickness },
            { "horizontalAlignment", "HorizontalAlignment", K::horizontalAlignment },
            { "verticalAlignment", "VerticalAlignment", K::verticalAlignment },
            { "content", "Content", K::string },
            { "text", "Text", K::string },
            { "header", "Header", K::string },
            { "title", "Title", K::string },
            { "placeholder", "Watermark", K::string },
            { "background", "Background", K::brush },
            { "foreground", "Foreground", K::brush },
            { "borderBrush", "BorderBrush", K::brush },
            { "borderThickness", "BorderThickness", K::thickness },
            { "cornerRadius", "CornerRadius", K::cornerRadius },
            { "fontFamily", "FontFamily", K::string },
            { "fontSize", "FontSize", K::number },
            { "fontWeight", "FontWeight", K::fontWeight },
            { "fontStyle", "FontStyle", K::fontStyle },
            { "orientation", "Orientation", K::orientation },
            { "isChecked", "IsChecked", K::nullableBoolean },
            { "isSelected", "IsSelected", K::boolean },
            { "isExpanded", "IsExpanded", K::boolean },
            { "isReadOnly", "IsReadOnly", K::boolean },
            { "command", "Command", K::binding },
            { "commandParameter", "CommandParameter", K::binding },
            { "clickMode", "ClickMode", K::string },
            { "items", "Items", K::collection },
            { "itemsSource", "ItemsSource", K::collection },
            { "selectedItem", "SelectedItem", K::binding },
            { "selectedIndex", "SelectedIndex", K::integer },
            { "value", "Value", K::number },
            { "minimum", "Minimum", K::number },
            { "maximum", "Maximum", K::number }
        };

        for (const auto& entry : propertyTable)
        {
            if (!registry.registerPropertyAlias(entry))
                DBG("[Saekim] Property alias skipped for '" + entry.source + "'.");
        }

        std::vector<ComponentAlias> componentTable {
            // Buttons
            alias("Button", "Button", "ui-button"),
            alias("RepeatButton", "RepeatButton", "ui-repeat-button"),
            alias("ToggleButton", "ToggleButton", "ui-toggle-button"),
            alias("RadioButton", "RadioButton", "ui-radio-button"),
            alias("CheckBox", "CheckBox", "ui-checkbox"),
            alias("HyperlinkButton", "HyperlinkButton", "ui-hyperlink-button"),
            alias("DropDownButton", "DropDownButton", "ui-dropdown-button"),
            alias("SplitButton", "SplitButton", "ui-split-button"),
            alias("ToggleSplitButton", "ToggleSplitButton"),

            // Inputs
            alias("TextBox", "TextBox", "ui-textbox"),
            alias("TextBlock", "TextBlock", "ui-textblock"),
            alias("Label", "Label", "ui-label"),
            alias("PasswordBox", "TextBox", "ui-password-box"),
            alias("MaskedTextBox", "MaskedTextBox", "ui-masked-textbox"),
            alias("NumericUpDown", "NumericUpDown", "ui-numeric-updown"),
            alias("Slider", "Slider", "ui-slider"),
            alias("RangeSlider", "RangeSlider"),

            // Selection
            alias("ComboBox", "ComboBox", "ui-combobox"),
            alias("ListBox", "ListBox", "ui-listbox"),
            alias("ListView", "ListBox", "ui-listbox"),
            alias("TreeView", "TreeView", "ui-treeview"),
            alias("DataGrid", "DataGrid", "ui-datagrid"),
            alias("AutoCompleteBox", "AutoCompleteBox", "ui-autocomplete-box"),

            // Containers
            alias("Window", "Window", "ui-window"),
            alias("UserControl", "UserControl", "ui-user-control"),
            alias("Panel", "Panel", "ui-panel"),
            alias("Border", "Border", "ui-border"),
            alias("ScrollViewer", "ScrollViewer", "ui-scrollviewer"),
            alias("Expander", "Expander", "ui-expander"),
            alias("GroupBox", "HeaderedContentControl", "ui-groupbox"),
            alias("TabControl", "TabControl", "ui-tabcontrol"),
            alias("TabItem", "TabItem", "ui-tabitem"),
            alias("Card", "Border", "ui-border", "AsciiCard"),
            alias("Viewbox", "Viewbox", "ui-viewbox"),

            // Layouts
            alias("StackPanel", "StackPanel", "layout-stackpanel"),
            alias("DockPanel", "DockPanel", "layout-dockpanel"),
            alias("Grid", "Grid", "layout-grid"),
            alias("WrapPanel", "WrapPanel", "layout-wrappanel"),
            alias("UniformGrid", "UniformGrid", "layout-uniformgrid"),
            alias("Canvas", "Canvas", "layout-canvas"),
            alias("RelativePanel", "RelativePanel", "layout-relativepanel"),
            alias("SplitView", "SplitView", "ui-splitview"),

            // Indicators
            alias("ProgressBar", "ProgressBar", "ui-progressbar"),
            withFixed(alias("ProgressRing", "ProgressBar", "ui-progressbar"), "IsIndeterminate", "True"),
            withFixed(alias("Spinner", "ProgressBar", "ui-progressbar"), "IsIndeterminate", "True"),
            alias("Badge", "Border", "ui-border"),

            // Navigation
            alias("Menu", "Menu", "ui-menu"),
            alias("MenuItem", "MenuItem", "ui-menuitem"),
            alias("ContextMenu", "ContextMenu", "ui-contextmenu"),
            withFixed(alias("ToolBar", "StackPanel", "layout-stackpanel"), "Orientation", "Horizontal"),
            withFixed(alias("StatusBar", "StackPanel", "layout-stackpanel"), "Orientation", "Horizontal"),
            alias("NavigationView", "SplitView", "ui-splitview"),
            alias("Breadcrumb", "ItemsControl", "ui-itemscontrol"),

            // Date and time
            alias("Calendar", "Calendar", "ui-calendar"),
            alias("DatePicker", "DatePicker", "ui-datepicker"),
            alias("TimePicker", "TimePicker", "ui-timepicker"),

            // Media
            alias("Image", "Image", "ui-image"),
            alias("MediaElement", "Image", "ui-image"),
            alias("PathIcon", "PathIcon", "ui-pathicon"),
            alias("SymbolIcon", "PathIcon", "ui-pathicon"),

            // Misc
            alias("Separator", "Separator", "ui-separator"),
            alias("ToggleSwitch", "ToggleSwitch", "ui-toggle-switch"),
            alias("ColorPicker", "ColorPicker"),
            alias("Flyout", "Flyout", "ui-flyout"),
            alias("ToolTip", "ToolTip", "ui-tooltip")
        };

        {
            auto popup = alias("Popup", "Popup", "ui-popup");
            popup.targetNamespace = "Avalonia.Controls.Primitives";
            componentTable.push_back(std::move(popup));
        }

        for (auto& entry : componentTable)
        {
            const auto name = entry.componentType;
            if (!registry.registerAlias(std::move(entry)))
                DBG("[Saekim] Component alias skipped for '" + name + "'.");
        }

        return registry;
    }

    const FrameworkAliasRegistry& defaultFrameworkAliasRegistry()
    {
        static const auto registry = makeDefaultFrameworkAliasRegistry();
        return registry;
    }
}
