#include "Saekim/Mapping/ControlMappings.h"

#include <functional>

namespace
{
    using Saekim::Convert::ConverterKind;
    using Saekim::Mapping::ControlMapping;
    using Saekim::Mapping::PropertyRule;

    PropertyRule rule(const char* source, const char* target, ConverterKind converter, juce::var defaultValue = {})
    {
        return PropertyRule { source, target, converter, std::move(defaultValue) };
    }

    ControlMapping control(const char* sourceType,
                           const char* targetElement,
                           const char* contentProperty,
                           const char* styleClass,
                           std::vector<PropertyRule> rules)
    {
        ControlMapping mapping;
        mapping.sourceType = sourceType;
        mapping.targetElement = targetElement;
        mapping.contentProperty = contentProperty;
        mapping.styleClass = styleClass;
        mapping.rules = std::move(rules);
        return mapping;
    }

    void forEachDefaultMapping(const std::function<void(ControlMapping)>& consume)
    {
        using K = ConverterKind;

        // Buttons
        consume(control("ui-button", "Button", "Content", "AsciiButton", {
            rule("text", "Content", K::string),
            rule("content", "Content", K::string),
            rule("width", "Width", K::dimension, "Auto"),
            rule("height", "Height", K::dimension, "Auto"),
            rule("enabled", "IsEnabled", K::boolean, true),
            rule("command", "Command", K::binding),
            rule("commandParameter", "CommandParameter", K::binding),
            rule("isDefault", "IsDefault", K::boolean, false),
            rule("isCancel", "IsCancel", K::boolean, false),
            rule("clickMode", "ClickMode", K::string, "Release"),
            rule("horizontalContentAlignment", "HorizontalContentAlignment", K::horizontalAlignment),
            rule("verticalContentAlignment", "VerticalContentAlignment", K::verticalAlignment)
        }));

        consume(control("ui-repeat-button", "RepeatButton", "Content", "AsciiRepeatButton", {
            rule("content", "Content", K::string),
            rule("delay", "Delay", K::integer, 300),
            rule("interval", "Interval", K::integer, 100),
            rule("command", "Command", K::binding)
        }));

        consume(control("ui-toggle-button", "ToggleButton", "Content", "AsciiToggleButton", {
            rule("content", "Content", K::string),
            rule("isChecked", "IsChecked", K::nullableBoolean, false),
            rule("isThreeState", "IsThreeState", K::boolean, false)
        }));

        consume(control("ui-split-button", "SplitButton", "Content", "AsciiSplitButton", {
            rule("content", "Content", K::string),
            rule("command", "Command", K::binding)
        }));

        consume(control("ui-dropdown-button", "DropDownButton", "Content", "AsciiDropDownButton", {
            rule("content", "Content", K::string)
        }));

        consume(control("ui-hyperlink-button", "HyperlinkButton", "Content", "AsciiHyperlinkButton", {
            rule("content", "Content", K::string),
            rule("navigateUri", "NavigateUri", K::string)
        }));

        // Text input
        consume(control("ui-textbox", "TextBox", "", "AsciiTextBox", {
            rule("text", "Text", K::string),
            rule("placeholder", "Watermark", K::string),
            rule("watermark", "Watermark", K::string),
            rule("maxLength", "MaxLength", K::integer, 0),
            rule("multiline", "AcceptsReturn", K::boolean, false),
            rule("acceptsReturn", "AcceptsReturn", K::boolean, false),
            rule("acceptsTab", "AcceptsTab", K::boolean, false),
            rule("readonly", "IsReadOnly", K::boolean, false),
            rule("textWrapping", "TextWrapping", K::textWrapping, "NoWrap"),
            rule("horizontalScrollBarVisibility", "HorizontalScrollBarVisibility", K::scrollBarVisibility),
            rule("verticalScrollBarVisibility", "VerticalScrollBarVisibility", K::scrollBarVisibility)
        }));

        {
            auto passwordBox = control("ui-password-box", "TextBox", "", "AsciiPasswordBox", {
                rule("password", "Text", K::string),
                rule("passwordChar", "PasswordChar", K::string),
                rule("revealPassword", "RevealPassword", K::boolean, false),
                rule("maxLength", "MaxLength", K::integer, 0)
            });
            passwordBox.fixedAttributes.set("PasswordChar", juce::String(juce::CharPointer_UTF8("\xe2\x97\x8f")));
            consume(std::move(passwordBox));
        }

        consume(control("ui-masked-textbox", "MaskedTextBox", "", "AsciiMaskedTextBox", {
            rule("text", "Text", K::string),
            rule("mask", "Mask", K::string),
            rule("promptChar", "PromptChar", K::string, "_")
        }));

        consume(control("ui-autocomplete-box", "AutoCompleteBox", "", "AsciiAutoCompleteBox", {
            rule("text", "Text", K::string),
            rule("watermark", "Watermark", K::string),
            rule("items", "ItemsSource", K::binding),
            rule("filterMode", "FilterMode", K::string, "StartsWith"),
            rule("minimumPrefixLength", "MinimumPrefixLength", K::integer, 1),
            rule("minimumPopulateDelay", "MinimumPopulateDelay", K::string)
        }));

        consume(control("ui-numeric-updown", "NumericUpDown", "", "AsciiNumericUpDown", {
            rule("value", "Value", K::number),
            rule("minimum", "Minimum", K::number),
            rule("maximum", "Maximum", K::number),
            rule("increment", "Increment", K::number, 1),
            rule("formatString", "FormatString", K::string),
            rule("watermark", "Watermark", K::string),
            rule("showButtonSpinner", "ShowButtonSpinner", K::boolean, true)
        }));

        // Selection
        consume(control("ui-checkbox", "CheckBox", "Content", "AsciiCheckBox", {
            rule("label", "Content", K::string),
            rule("content", "Content", K::string),
            rule("checked", "IsChecked", K::nullableBoolean, false),
            rule("isChecked", "IsChecked", K::nullableBoolean, false),
            rule("threeState", "IsThreeState", K::boolean, false),
            rule("isThreeState", "IsThreeState", K::boolean, false)
        }));

        consume(control("ui-radio-button", "RadioButton", "Content", "AsciiRadioButton", {
            rule("content", "Content", K::string),
            rule("isChecked", "IsChecked", K::boolean, false),
            rule("groupName", "GroupName", K::string)
        }));

        consume(control("ui-toggle-switch", "ToggleSwitch", "", "AsciiToggleSwitch", {
            rule("isOn", "IsChecked", K::boolean, false),
            rule("isChecked", "IsChecked", K::boolean, false),
            rule("onContent", "OnContent", K::string),
            rule("offContent", "OffContent", K::string)
        }));

        consume(control("ui-combobox", "ComboBox", "Items", "AsciiComboBox", {
            rule("items", "ItemsSource", K::binding),
            rule("selectedItem", "SelectedItem", K::binding),
            rule("selectedIndex", "SelectedIndex", K::integer, -1),
            rule("placeholder", "PlaceholderText", K::string),
            rule("placeholderText", "PlaceholderText", K::string),
            rule("isEditable", "IsEditable", K::boolean, false),
            rule("maxDropDownHeight", "MaxDropDownHeight", K::dimension)
        }));

        consume(control("ui-listbox", "ListBox", "Items", "AsciiListBox", {
            rule("items", "ItemsSource", K::binding),
            rule("selectedItem", "SelectedItem", K::binding),
            rule("selectedItems", "SelectedItems", K::binding),
            rule("selectionMode", "SelectionMode", K::selectionMode, "Single")
        }));

        consume(control("ui-slider", "Slider", "", "AsciiSlider", {
            rule("value", "Value", K::number, 0),
            rule("minimum", "Minimum", K::number, 0),
            rule("maximum", "Maximum", K::number, 100),
            rule("smallChange", "SmallChange", K::number, 1),
            rule("largeChange", "LargeChange", K::number, 10),
            rule("orientation", "Orientation", K::orientation, "Horizontal"),
            rule("isSnapToTickEnabled", "IsSnapToTickEnabled", K::boolean, false),
            rule("tickFrequency", "TickFrequency", K::number, 0),
            rule("tickPlacement", "TickPlacement", K::string, "None")
        }));

        // Date and time
        consume(control("ui-datepicker", "DatePicker", "", "AsciiDatePicker", {
            rule("selectedDate", "SelectedDate", K::binding),
            rule("displayDate", "DisplayDate", K::binding),
            rule("displayDateStart", "DisplayDateStart", K::binding),
            rule("displayDateEnd", "DisplayDateEnd", K::binding),
            rule("dayFormat", "DayFormat", K::string),
            rule("monthFormat", "MonthFormat", K::string),
            rule("yearFormat", "YearFormat", K::string)
        }));

        consume(control("ui-timepicker", "TimePicker", "", "AsciiTimePicker", {
            rule("selectedTime", "SelectedTime", K::binding),
            rule("minuteIncrement", "MinuteIncrement", K::integer, 1),
            rule("clockIdentifier", "ClockIdentifier", K::string)
        }));

        consume(control("ui-calendar", "Calendar", "", "AsciiCalendar", {
            rule("selectedDate", "SelectedDate", K::binding),
            rule("displayMode", "DisplayMode", K::string, "Month"),
            rule("selectionMode", "SelectionMode", K::string, "SingleDate"),
            rule("firstDayOfWeek", "FirstDayOfWeek", K::string)
        }));

        // Containers
        consume(control("ui-window", "Window", "Content", "", {
            rule("title", "Title", K::string),
            rule("width", "Width", K::dimension, "Auto"),
            rule("height", "Height", K::dimension, "Auto"),
            rule("minWidth", "MinWidth", K::dimension, 0),
            rule("minHeight", "MinHeight", K::dimension, 0),
            rule("maxWidth", "MaxWidth", K::dimension, "Infinity"),
            rule("maxHeight", "MaxHeight", K::dimension, "Infinity"),
            rule("canResize", "CanResize", K::boolean, true),
            rule("showInTaskbar", "ShowInTaskbar", K::boolean, true),
            rule("topmost", "Topmost", K::boolean, false),
            rule("windowStartupLocation", "WindowStartupLocation", K::string, "Manual"),
            rule("windowState", "WindowState", K::string, "Normal"),
            rule("systemDecorations", "SystemDecorations", K::string, "Full"),
            rule("extendClientAreaToDecorationsHint", "ExtendClientAreaToDecorationsHint", K::boolean, false)
        }));

        consume(control("ui-user-control", "UserControl", "Content", "", {
            rule("width", "Width", K::dimension, "Auto"),
            rule("height", "Height", K::dimension, "Auto")
        }));

        consume(control("ui-border", "Border", "Child", "", {
            rule("background", "Background", K::brush),
            rule("borderBrush", "BorderBrush", K::brush),
            rule("borderThickness", "BorderThickness", K::thickness, 0),
            rule("cornerRadius", "CornerRadius", K::cornerRadius, 0),
            rule("padding", "Padding", K::thickness, 0)
        }));

        consume(control("ui-panel", "Panel", "Children", "", {
            rule("background", "Background", K::brush)
        }));

        consume(control("ui-tabcontrol", "TabControl", "Items", "AsciiTabControl", {
            rule("tabPlacement", "TabStripPlacement", K::dock, "Top"),
            rule("tabStripPlacement", "TabStripPlacement", K::dock, "Top"),
            rule("selectedIndex", "SelectedIndex", K::integer),
            rule("selectedItem", "SelectedItem", K::binding)
        }));

        consume(control("ui-tabitem", "TabItem", "Content", "AsciiTabItem", {
            rule("header", "Header", K::string),
            rule("isSelected", "IsSelected", K::boolean, false)
        }));

        consume(control("ui-expander", "Expander", "Content", "AsciiExpander", {
            rule("header", "Header", K::string),
            rule("expanded", "IsExpanded", K::boolean, false),
            rule("isExpanded", "IsExpanded", K::boolean, false),
            rule("direction", "ExpandDirection", K::expandDirection, "Down"),
            rule("expandDirection", "ExpandDirection", K::expandDirection, "Down")
        }));

        consume(control("ui-groupbox", "HeaderedContentControl", "Content", "AsciiGroupBox", {
            rule("header", "Header", K::string)
        }));

        consume(control("ui-scrollviewer", "ScrollViewer", "Content", "", {
            rule("horizontalScrollBarVisibility", "HorizontalScrollBarVisibility", K::scrollBarVisibility, "Disabled"),
            rule("verticalScrollBarVisibility", "VerticalScrollBarVisibility", K::scrollBarVisibility, "Auto"),
            rule("allowAutoHide", "AllowAutoHide", K::boolean, true)
        }));

        consume(control("ui-splitview", "SplitView", "Content", "AsciiSplitView", {
            rule("isPaneOpen", "IsPaneOpen", K::boolean, false),
            rule("displayMode", "DisplayMode", K::string, "Overlay"),
            rule("panePlacement", "PanePlacement", K::string, "Left"),
            rule("openPaneLength", "OpenPaneLength", K::dimension, 320),
            rule("compactPaneLength", "CompactPaneLength", K::dimension, 48)
        }));

        consume(control("ui-flyout", "Flyout", "Content", "", {
            rule("placement", "Placement", K::string),
            rule("showMode", "ShowMode", K::string)
        }));

        {
            auto popup = control("ui-popup", "Popup", "Child", "", {
                rule("isOpen", "IsOpen", K::boolean, false),
                rule("placement", "Placement", K::string),
                rule("placementTarget", "PlacementTarget", K::binding),
                rule("isLightDismissEnabled", "IsLightDismissEnabled", K::boolean, false)
            });
            popup.targetNamespace = "Avalonia.Controls.Primitives";
            consume(std::move(popup));
        }

        consume(control("ui-viewbox", "Viewbox", "Child", "", {
            rule("stretch", "Stretch", K::stretch, "Uniform")
        }));

        // Layout panels
        {
            auto grid = control("layout-grid", "Grid", "Children", "", {
                rule("rows", "RowDefinitions", K::rowDefinitions),
                rule("rowDefinitions", "RowDefinitions", K::rowDefinitions),
                rule("columns", "ColumnDefinitions", K::columnDefinitions),
                rule("columnDefinitions", "ColumnDefinitions", K::columnDefinitions),
                rule("rowSpacing", "RowSpacing", K::dimension, 0),
                rule("columnSpacing", "ColumnSpacing", K::dimension, 0),
                rule("showGridLines", "ShowGridLines", K::boolean, false)
            });
            grid.attachedProperties = { "Grid.Row", "Grid.Column", "Grid.RowSpan", "Grid.ColumnSpan" };
            consume(std::move(grid));
        }

        consume(control("layout-stackpanel", "StackPanel", "Children", "", {
            rule("orientation", "Orientation", K::orientation, "Vertical"),
            rule("spacing", "Spacing", K::dimension, 0)
        }));

        {
            auto dockPanel = control("layout-dockpanel", "DockPanel", "Children", "", {
                rule("lastChildFill", "LastChildFill", K::boolean, true)
            });
            dockPanel.attachedProperties = { "DockPanel.Dock" };
            consume(std::move(dockPanel));
        }

        consume(control("layout-wrappanel", "WrapPanel", "Children", "", {
            rule("orientation", "Orientation", K::orientation, "Horizontal"),
            rule("itemWidth", "ItemWidth", K::dimension, "NaN"),
            rule("itemHeight", "ItemHeight", K::dimension, "NaN")
        }));

        consume(control("layout-uniformgrid", "UniformGrid", "Children", "", {
            rule("rows", "Rows", K::integer, 0),
            rule("columns", "Columns", K::integer, 0)
        }));

        {
            auto canvas = control("layout-canvas", "Canvas", "Children", "", {
                rule("background", "Background", K::brush)
            });
            canvas.attachedProperties = { "Canvas.Left", "Canvas.Top", "Canvas.Right", "Canvas.Bottom" };
            consume(std::move(canvas));
        }

        {
            auto relativePanel = control("layout-relativepanel", "RelativePanel", "Children", "", {});
            relativePanel.attachedProperties = {
                "RelativePanel.Above", "RelativePanel.Below",
                "RelativePanel.LeftOf", "RelativePanel.RightOf",
                "RelativePanel.AlignLeftWith", "RelativePanel.AlignRightWith",
                "RelativePanel.AlignTopWith", "RelativePanel.AlignBottomWith",
                "RelativePanel.AlignHorizontalCenterWith", "RelativePanel.AlignVerticalCenterWith"
            };
            consume(std::move(relativePanel));
        }

        // Data display
        consume(control("ui-datagrid", "DataGrid", "Columns", "AsciiDataGrid", {
            rule("items", "ItemsSource", K::binding),
            rule("itemsSource", "ItemsSource", K::binding),
            rule("autoGenerateColumns", "AutoGenerateColumns", K::boolean),
            rule("canUserSortColumns", "CanUserSortColumns", K::boolean, true),
            rule("canUserResizeColumns", "CanUserResizeColumns", K::boolean),
            rule("canUserReorderColumns", "CanUserReorderColumns", K::boolean),
            rule("gridLinesVisibility", "GridLinesVisibility", K::string),
            rule("isReadOnly", "IsReadOnly", K::boolean, false),
            rule("selectionMode", "SelectionMode", K::string, "Extended")
        }));

        consume(control("ui-treeview", "TreeView", "Items", "AsciiTreeView", {
            rule("items", "ItemsSource", K::binding),
            rule("itemsSource", "ItemsSource", K::binding),
            rule("selectionMode", "SelectionMode", K::selectionMode, "Single"),
            rule("selectedItem", "SelectedItem", K::binding)
        }));

        consume(control("ui-treeviewitem", "TreeViewItem", "Items", "AsciiTreeViewItem", {
            rule("header", "Header", K::string),
            rule("isExpanded", "IsExpanded", K::boolean, false),
            rule("isSelected", "IsSelected", K::boolean, false)
        }));

        consume(control("ui-itemscontrol", "ItemsControl", "Items", "", {
            rule("items", "ItemsSource", K::collection),
            rule("itemsSource", "ItemsSource", K::collection)
        }));

        consume(control("ui-textblock", "TextBlock", "Text", "", {
            rule("text", "Text", K::string),
            rule("fontFamily", "FontFamily", K::string),
            rule("fontSize", "FontSize", K::number),
            rule("fontWeight", "FontWeight", K::fontWeight, "Normal"),
            rule("fontStyle", "FontStyle", K::fontStyle, "Normal"),
            rule("foreground", "Foreground", K::brush),
            rule("textAlignment", "TextAlignment", K::textAlignment),
            rule("textWrapping", "TextWrapping", K::textWrapping, "NoWrap"),
            rule("textTrimming", "TextTrimming", K::string, "None"),
            rule("lineHeight", "LineHeight", K::number),
            rule("maxLines", "MaxLines", K::integer, 0)
        }));

        consume(control("ui-label", "Label", "Content", "", {
            rule("content", "Content", K::string),
            rule("target", "Target", K::binding)
        }));

        consume(control("ui-selectable-textblock", "SelectableTextBlock", "Text", "", {
            rule("text", "Text", K::string),
            rule("fontFamily", "FontFamily", K::string),
            rule("fontSize", "FontSize", K::number),
            rule("fontWeight", "FontWeight", K::fontWeight, "Normal"),
            rule("selectionBrush", "SelectionBrush", K::brush)
        }));

        // Indicators
        consume(control("ui-progressbar", "ProgressBar", "", "AsciiProgressBar", {
            rule("value", "Value", K::number, 0),
            rule("minimum", "Minimum", K::number, 0),
            rule("maximum", "Maximum", K::number, 100),
            rule("isIndeterminate", "IsIndeterminate", K::boolean, false),
            rule("orientation", "Orientation", K::orientation, "Horizontal"),
            rule("showProgressText", "ShowProgressText", K::boolean, false),
            rule("progressTextFormat", "ProgressTextFormat", K::string)
        }));

        consume(control("ui-tooltip", "ToolTip", "Content", "", {
            rule("content", "Content", K::string),
            rule("placement", "Placement", K::string),
            rule("showDelay", "ShowDelay", K::integer, 400)
        }));

        consume(control("ui-separator", "Separator", "", "", {}));

        // Menus
        consume(control("ui-menu", "Menu", "Items", "AsciiMenu", {}));

        consume(control("ui-menuitem", "MenuItem", "Items", "AsciiMenuItem", {
            rule("header", "Header", K::string),
            rule("icon", "Icon", K::string),
            rule("command", "Command", K::binding),
            rule("commandParameter", "CommandParameter", K::binding),
            rule("inputGesture", "InputGesture", K::string),
            rule("isEnabled", "IsEnabled", K::boolean, true)
        }));

        consume(control("ui-contextmenu", "ContextMenu", "Items", "AsciiContextMenu", {}));

        // Media
        consume(control("ui-image", "Image", "", "", {
            rule("source", "Source", K::string),
            rule("stretch", "Stretch", K::stretch, "Uniform"),
            rule("stretchDirection", "StretchDirection", K::string, "Both")
        }));

        consume(control("ui-pathicon", "PathIcon", "", "", {
            rule("data", "Data", K::geometry),
            rule("foreground", "Foreground", K::brush)
        }));
    }
}

namespace Saekim::Mapping
{
    MappingRegistry makeDefaultMappingRegistry()
    {
        MappingRegistry registry;

        forEachDefaultMapping([&registry](ControlMapping mapping)
        {
            const auto sourceType = mapping.sourceType;
            if (!registry.registerMapping(std::move(mapping)))
                DBG("[Saekim] Mapping registration skipped for '" + sourceType + "' (duplicate or invalid).");
        });

        return registry;
    }

    const MappingRegistry& defaultMappingRegistry()
    {
        static const auto registry = makeDefaultMappingRegistry();
        return registry;
    }
}
