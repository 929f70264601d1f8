#include "Saekim/Convert/ValueConverters.h"

#include "Saekim/Core/XmlText.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <initializer_list>
#include <utility>

namespace
{
    using Saekim::Convert::ConvertOptions;
    using Saekim::Convert::ConverterKind;
    using Saekim::Convert::ConverterResult;
    using Saekim::Convert::formatNumber;
    using Saekim::Convert::readNumber;
    using Saekim::Convert::varToText;

    using OptionalResult = std::optional<ConverterResult>;
    using EnumTable = std::initializer_list<std::pair<const char*, const char*>>;

    constexpr double kPi = 3.14159265358979323846;

    bool isDigitAt(const juce::String& text, int index)
    {
        return index < text.length() && text[index] >= '0' && text[index] <= '9';
    }

    // [+-] digits [. digits] [(e|E) [+-] digits], with at least one mantissa digit.
    bool isWellFormedNumber(const juce::String& text)
    {
        int index = 0;
        if (text.startsWithChar('-') || text.startsWithChar('+'))
            ++index;

        int mantissaDigits = 0;
        while (isDigitAt(text, index))
        {
            ++index;
            ++mantissaDigits;
        }

        if (index < text.length() && text[index] == '.')
        {
            ++index;
            while (isDigitAt(text, index))
            {
                ++index;
                ++mantissaDigits;
            }
        }

        if (mantissaDigits == 0)
            return false;

        if (index < text.length() && (text[index] == 'e' || text[index] == 'E'))
        {
            ++index;
            if (index < text.length() && (text[index] == '-' || text[index] == '+'))
                ++index;
            if (!isDigitAt(text, index))
                return false;
            while (isDigitAt(text, index))
                ++index;
        }

        return index == text.length();
    }

    struct KindKey
    {
        ConverterKind kind;
        const char* key;
    };

    constexpr KindKey kKindKeys[] = {
        { ConverterKind::string, "string" },
        { ConverterKind::integer, "integer" },
        { ConverterKind::number, "double" },
        { ConverterKind::boolean, "boolean" },
        { ConverterKind::nullableBoolean, "nullable-boolean" },
        { ConverterKind::dimension, "dimension" },
        { ConverterKind::binding, "binding" },
        { ConverterKind::collection, "collection" },
        { ConverterKind::orientation, "orientation" },
        { ConverterKind::dock, "dock" },
        { ConverterKind::expandDirection, "expand-direction" },
        { ConverterKind::selectionMode, "selection-mode" },
        { ConverterKind::horizontalAlignment, "horizontal-alignment" },
        { ConverterKind::verticalAlignment, "vertical-alignment" },
        { ConverterKind::textAlignment, "text-alignment" },
        { ConverterKind::textWrapping, "text-wrapping" },
        { ConverterKind::scrollBarVisibility, "scrollbar-visibility" },
        { ConverterKind::fontWeight, "font-weight" },
        { ConverterKind::fontStyle, "font-style" },
        { ConverterKind::stretch, "stretch" },
        { ConverterKind::thickness, "thickness" },
        { ConverterKind::cornerRadius, "corner-radius" },
        { ConverterKind::brush, "brush" },
        { ConverterKind::gridLength, "grid-length" },
        { ConverterKind::rowDefinitions, "row-definitions" },
        { ConverterKind::columnDefinitions, "column-definitions" },
        { ConverterKind::point, "point" },
        { ConverterKind::geometry, "geometry" },
        { ConverterKind::linearGradient, "linear-gradient" },
        { ConverterKind::radialGradient, "radial-gradient" },
        { ConverterKind::imageBrush, "image-brush" },
        { ConverterKind::effect, "effect" },
        { ConverterKind::transform, "transform" }
    };

    bool isAbsent(const juce::var& value) noexcept
    {
        return value.isVoid() || value.isUndefined();
    }

    juce::Result emit(OptionalResult& out, juce::String text, bool fragment = false)
    {
        out = ConverterResult { std::move(text), fragment };
        return juce::Result::ok();
    }

    juce::String describe(const juce::var& value)
    {
        const auto text = varToText(value);
        return text.length() > 40 ? text.substring(0, 40) + "..." : text;
    }

    const juce::NamedValueSet* objectProperties(const juce::var& value) noexcept
    {
        if (const auto* object = value.getDynamicObject())
            return &object->getProperties();
        return nullptr;
    }

    juce::var firstPresent(const juce::NamedValueSet& props, std::initializer_list<const char*> keys)
    {
        for (const auto* key : keys)
        {
            const juce::Identifier id(key);
            if (props.contains(id) && !isAbsent(props[id]))
                return props[id];
        }

        return {};
    }

    double numberOr(const juce::NamedValueSet& props, std::initializer_list<const char*> keys, double fallback)
    {
        const auto value = firstPresent(props, keys);
        if (const auto number = readNumber(value))
            return *number;
        return fallback;
    }

    juce::String lettersOnly(const juce::String& text)
    {
        return text.toLowerCase().retainCharacters("abcdefghijklmnopqrstuvwxyz");
    }

    juce::String lookupEnum(const juce::String& key, const juce::String& original, EnumTable table)
    {
        for (const auto& [from, to] : table)
        {
            if (key == from)
                return to;
        }

        return original;
    }

    juce::String collapseWhitespace(const juce::String& text)
    {
        juce::StringArray tokens;
        tokens.addTokens(text.trim(), " \t\r\n", {});
        tokens.removeEmptyStrings();
        return tokens.joinIntoString(" ");
    }

    bool looksLikeIdentifierPath(const juce::String& text)
    {
        if (text.length() < 2)
            return false;

        const auto first = text[0];
        if (first < 'A' || first > 'Z')
            return false;

        return text.substring(1).containsOnly("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789.");
    }

    std::optional<std::vector<double>> readNumberList(const juce::var& value)
    {
        std::vector<double> numbers;

        if (const auto* array = value.getArray())
        {
            for (const auto& item : *array)
            {
                const auto number = readNumber(item);
                if (!number)
                    return std::nullopt;
                numbers.push_back(*number);
            }

            return numbers;
        }

        if (!value.isString())
            return std::nullopt;

        juce::StringArray tokens;
        tokens.addTokens(value.toString().trim(), ", \t", {});
        tokens.removeEmptyStrings();

        for (const auto& token : tokens)
        {
            const auto number = readNumber(juce::var(token));
            if (!number)
                return std::nullopt;
            numbers.push_back(*number);
        }

        return numbers;
    }

    juce::String joinNumbers(std::initializer_list<double> values)
    {
        juce::StringArray parts;
        for (const auto value : values)
            parts.add(formatNumber(value));
        return parts.joinIntoString(",");
    }

    juce::Result collapseThickness(const std::vector<double>& values, OptionalResult& out)
    {
        if (values.size() == 1)
            return emit(out, formatNumber(values[0]));

        if (values.size() == 2)
        {
            if (values[0] == values[1])
                return emit(out, formatNumber(values[0]));
            return emit(out, joinNumbers({ values[0], values[1] }));
        }

        if (values.size() == 4)
        {
            const auto left = values[0];
            const auto top = values[1];
            const auto right = values[2];
            const auto bottom = values[3];

            if (left == top && top == right && right == bottom)
                return emit(out, formatNumber(left));
            if (left == right && top == bottom)
                return emit(out, joinNumbers({ left, top }));
            return emit(out, joinNumbers({ left, top, right, bottom }));
        }

        return juce::Result::fail("thickness needs 1, 2 or 4 values, got " + juce::String(static_cast<int>(values.size())));
    }

    juce::Result collapseCornerRadius(const std::vector<double>& values, OptionalResult& out)
    {
        if (values.size() == 1)
            return emit(out, formatNumber(values[0]));

        if (values.size() == 2)
        {
            if (values[0] == values[1])
                return emit(out, formatNumber(values[0]));
            return emit(out, joinNumbers({ values[0], values[1] }));
        }

        if (values.size() == 4)
        {
            const auto topLeft = values[0];
            const auto topRight = values[1];
            const auto bottomRight = values[2];
            const auto bottomLeft = values[3];

            if (topLeft == topRight && topRight == bottomRight && bottomRight == bottomLeft)
                return emit(out, formatNumber(topLeft));
            if (topLeft == topRight && bottomRight == bottomLeft)
                return emit(out, joinNumbers({ topLeft, bottomLeft }));
            return emit(out, joinNumbers({ topLeft, topRight, bottomRight, bottomLeft }));
        }

        return juce::Result::fail("corner radius needs 1, 2 or 4 values, got " + juce::String(static_cast<int>(values.size())));
    }

    juce::String hexByte(int value)
    {
        return juce::String::toHexString(juce::jlimit(0, 255, value)).paddedLeft('0', 2).toUpperCase();
    }

    juce::String formatPercent(double fraction)
    {
        const auto percent = std::round(fraction * 10000.0) / 100.0;
        return formatNumber(percent) + "%";
    }

    juce::String relativePoint(double x, double y)
    {
        return formatPercent(x) + "," + formatPercent(y);
    }

    juce::String readRelativePoint(const juce::var& value, double defaultX, double defaultY)
    {
        if (const auto* props = objectProperties(value))
            return relativePoint(numberOr(*props, { "x" }, defaultX), numberOr(*props, { "y" }, defaultY));

        if (const auto numbers = readNumberList(value); numbers && numbers->size() == 2)
            return relativePoint((*numbers)[0], (*numbers)[1]);

        return relativePoint(defaultX, defaultY);
    }

    //==============================================================================
    juce::Result convertString(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return emit(out, varToText(value));
    }

    juce::Result convertInteger(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isBool())
            return juce::Result::fail("expected an integer, got a boolean");

        if (Saekim::isNumericVar(value))
        {
            const auto numeric = static_cast<double>(value);
            if (!std::isfinite(numeric))
                return juce::Result::fail("integer value is not finite");
            return emit(out, juce::String(static_cast<juce::int64>(std::trunc(numeric))));
        }

        if (value.isString())
        {
            // Whole-string numbers only; fractions truncate like numeric input.
            const auto number = readNumber(value);
            if (!number.has_value())
                return juce::Result::fail("'" + describe(value) + "' is not an integer");

            return emit(out, juce::String(static_cast<juce::int64>(std::trunc(*number))));
        }

        return juce::Result::fail("expected an integer, got '" + describe(value) + "'");
    }

    juce::Result convertNumber(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isBool())
            return juce::Result::fail("expected a number, got a boolean");

        if (const auto number = readNumber(value))
            return emit(out, formatNumber(*number));

        return juce::Result::fail("'" + describe(value) + "' is not a finite number");
    }

    juce::Result convertBoolean(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isBool())
            return emit(out, static_cast<bool>(value) ? "True" : "False");

        if (Saekim::isNumericVar(value))
            return emit(out, static_cast<double>(value) != 0.0 ? "True" : "False");

        const auto text = value.toString().trim();
        if (text.equalsIgnoreCase("true"))
            return emit(out, "True");
        if (text.equalsIgnoreCase("false"))
            return emit(out, "False");

        return juce::Result::fail("'" + describe(value) + "' is not a boolean");
    }

    juce::Result convertNullableBoolean(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        if (value.isString())
        {
            const auto text = value.toString().trim();
            if (text.isEmpty() || text.equalsIgnoreCase("null"))
                return emit(out, "{x:Null}");
        }

        return convertBoolean(value, options, out);
    }

    juce::Result convertDimension(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        if (value.isString())
        {
            auto text = value.toString().trim();
            const auto lower = text.toLowerCase();

            if (lower == "auto")
                return emit(out, "Auto");
            if (lower == "nan")
                return emit(out, "NaN");
            if (lower == "infinity")
                return emit(out, "Infinity");
            if (text == "*")
                return emit(out, "*");

            if (lower.endsWith("px"))
                text = text.dropLastCharacters(2).trim();

            if (const auto number = readNumber(juce::var(text)))
                return emit(out, formatNumber(*number));

            return juce::Result::fail("'" + describe(value) + "' is not a dimension");
        }

        return convertNumber(value, options, out);
    }

    juce::Result convertBinding(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        if (value.isArray() || value.isObject())
            return juce::Result::fail("inline values cannot be bound, expected a property path");

        const auto text = varToText(value).trim();
        if (looksLikeIdentifierPath(text))
            return emit(out, "{Binding " + text + ", Mode=" + options.bindingMode + "}");

        return emit(out, text);
    }

    juce::Result convertCollection(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isArray() || value.isObject())
            return juce::Result::fail("inline item lists cannot be expressed as an attribute");

        const auto text = varToText(value).trim();
        if (looksLikeIdentifierPath(text))
            return emit(out, "{Binding " + text + "}");

        return emit(out, text);
    }

    juce::Result convertEnum(const juce::var& value, OptionalResult& out, EnumTable table)
    {
        const auto original = varToText(value).trim();
        return emit(out, lookupEnum(original.toLowerCase(), original, table));
    }

    juce::Result convertOrientation(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "horizontal", "Horizontal" }, { "vertical", "Vertical" },
                                         { "h", "Horizontal" }, { "v", "Vertical" } });
    }

    juce::Result convertDock(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "left", "Left" }, { "top", "Top" },
                                         { "right", "Right" }, { "bottom", "Bottom" } });
    }

    juce::Result convertExpandDirection(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "down", "Down" }, { "up", "Up" },
                                         { "left", "Left" }, { "right", "Right" } });
    }

    juce::Result convertSelectionMode(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        const auto original = varToText(value).trim();
        return emit(out, lookupEnum(lettersOnly(original), original,
                                    { { "single", "Single" }, { "multiple", "Multiple" },
                                      { "extended", "Multiple" }, { "toggle", "Toggle" },
                                      { "alwaysselected", "AlwaysSelected" } }));
    }

    juce::Result convertHorizontalAlignment(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "left", "Left" }, { "center", "Center" }, { "centre", "Center" },
                                         { "right", "Right" }, { "stretch", "Stretch" } });
    }

    juce::Result convertVerticalAlignment(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "top", "Top" }, { "center", "Center" }, { "centre", "Center" },
                                         { "bottom", "Bottom" }, { "stretch", "Stretch" } });
    }

    juce::Result convertTextAlignment(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "left", "Left" }, { "center", "Center" }, { "right", "Right" },
                                         { "justify", "Justify" }, { "start", "Start" }, { "end", "End" } });
    }

    juce::Result convertTextWrapping(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        const auto original = varToText(value).trim();
        return emit(out, lookupEnum(lettersOnly(original), original,
                                    { { "nowrap", "NoWrap" }, { "wrap", "Wrap" },
                                      { "wrapwithoverflow", "WrapWithOverflow" } }));
    }

    juce::Result convertScrollBarVisibility(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "disabled", "Disabled" }, { "auto", "Auto" },
                                         { "hidden", "Hidden" }, { "visible", "Visible" } });
    }

    juce::Result convertFontWeight(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        const auto original = varToText(value).trim();
        const auto key = original.toLowerCase().retainCharacters("abcdefghijklmnopqrstuvwxyz0123456789");
        return emit(out, lookupEnum(key, original,
                                    { { "thin", "Thin" }, { "100", "Thin" },
                                      { "extralight", "ExtraLight" }, { "ultralight", "ExtraLight" }, { "200", "ExtraLight" },
                                      { "light", "Light" }, { "300", "Light" },
                                      { "normal", "Normal" }, { "regular", "Regular" }, { "400", "Normal" },
                                      { "medium", "Medium" }, { "500", "Medium" },
                                      { "semibold", "SemiBold" }, { "demibold", "SemiBold" }, { "600", "SemiBold" },
                                      { "bold", "Bold" }, { "700", "Bold" },
                                      { "extrabold", "ExtraBold" }, { "ultrabold", "ExtraBold" }, { "800", "ExtraBold" },
                                      { "black", "Black" }, { "heavy", "Black" }, { "900", "Black" } }));
    }

    juce::Result convertFontStyle(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertEnum(value, out, { { "normal", "Normal" }, { "italic", "Italic" }, { "oblique", "Oblique" } });
    }

    juce::Result convertStretch(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        const auto original = varToText(value).trim();
        return emit(out, lookupEnum(lettersOnly(original), original,
                                    { { "fill", "Fill" }, { "fit", "Uniform" }, { "contain", "Uniform" },
                                      { "uniform", "Uniform" }, { "crop", "UniformToFill" },
                                      { "cover", "UniformToFill" }, { "uniformtofill", "UniformToFill" },
                                      { "none", "None" }, { "tile", "None" } }));
    }

    juce::Result convertThickness(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isBool())
            return juce::Result::fail("expected a thickness, got a boolean");

        if (Saekim::isNumericVar(value))
        {
            const auto number = readNumber(value);
            if (!number)
                return juce::Result::fail("thickness value is not finite");
            return emit(out, formatNumber(*number));
        }

        if (const auto* props = objectProperties(value))
        {
            if (props->contains("horizontal") || props->contains("vertical"))
            {
                return collapseThickness({ numberOr(*props, { "horizontal" }, 0.0),
                                           numberOr(*props, { "vertical" }, 0.0) },
                                         out);
            }

            return collapseThickness({ numberOr(*props, { "left" }, 0.0),
                                       numberOr(*props, { "top" }, 0.0),
                                       numberOr(*props, { "right" }, 0.0),
                                       numberOr(*props, { "bottom" }, 0.0) },
                                     out);
        }

        if (value.isString() && !value.toString().trim().containsOnly("0123456789.,-+ \t"))
            return emit(out, value.toString().trim());

        if (const auto numbers = readNumberList(value); numbers && !numbers->empty())
            return collapseThickness(*numbers, out);

        return juce::Result::fail("'" + describe(value) + "' is not a thickness");
    }

    juce::Result convertCornerRadius(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isBool())
            return juce::Result::fail("expected a corner radius, got a boolean");

        if (Saekim::isNumericVar(value))
        {
            const auto number = readNumber(value);
            if (!number)
                return juce::Result::fail("corner radius is not finite");
            return emit(out, formatNumber(*number));
        }

        if (const auto* props = objectProperties(value))
        {
            if (props->contains("top") || props->contains("bottom"))
            {
                return collapseCornerRadius({ numberOr(*props, { "top" }, 0.0),
                                              numberOr(*props, { "bottom" }, 0.0) },
                                            out);
            }

            return collapseCornerRadius({ numberOr(*props, { "topLeft" }, 0.0),
                                          numberOr(*props, { "topRight" }, 0.0),
                                          numberOr(*props, { "bottomRight" }, 0.0),
                                          numberOr(*props, { "bottomLeft" }, 0.0) },
                                        out);
        }

        if (value.isString() && !value.toString().trim().containsOnly("0123456789.,-+ \t"))
            return emit(out, value.toString().trim());

        if (const auto numbers = readNumberList(value); numbers && !numbers->empty())
            return collapseCornerRadius(*numbers, out);

        return juce::Result::fail("'" + describe(value) + "' is not a corner radius");
    }

    std::vector<std::pair<juce::String, juce::String>> readGradientStops(const juce::NamedValueSet& props)
    {
        std::vector<std::pair<juce::String, juce::String>> stops;

        const auto stopsVar = firstPresent(props, { "stops", "gradientStops" });
        const auto* stopArray = stopsVar.getArray();
        if (stopArray == nullptr || stopArray->isEmpty())
        {
            stops.emplace_back("0", "White");
            stops.emplace_back("1", "Black");
            return stops;
        }

        const auto count = stopArray->size();
        for (int i = 0; i < count; ++i)
        {
            const auto& stop = stopArray->getReference(i);
            const auto fallbackOffset = count > 1 ? static_cast<double>(i) / static_cast<double>(count - 1) : 0.0;

            auto offset = fallbackOffset;
            juce::String color { "Black" };

            if (const auto* stopProps = objectProperties(stop))
            {
                offset = numberOr(*stopProps, { "offset", "position" }, fallbackOffset);
                if (const auto hex = Saekim::Convert::colorToHex(firstPresent(*stopProps, { "color" })))
                    color = *hex;
            }
            else if (const auto hex = Saekim::Convert::colorToHex(stop))
            {
                color = *hex;
            }

            if (offset > 1.0)
                offset /= 100.0;

            stops.emplace_back(formatNumber(juce::jlimit(0.0, 1.0, offset)), color);
        }

        return stops;
    }

    juce::Result emitGradient(const juce::String& openTag,
                              const juce::String& element,
                              const juce::NamedValueSet& props,
                              const ConvertOptions& options,
                              OptionalResult& out)
    {
        juce::StringArray lines;
        lines.add(openTag);

        for (const auto& [offset, color] : readGradientStops(props))
        {
            lines.add(options.indentUnit + "<GradientStop Offset=\"" + offset
                      + "\" Color=\"" + Saekim::Core::escapeMarkupValue(color) + "\" />");
        }

        lines.add("</" + element + ">");
        return emit(out, lines.joinIntoString("\n"), true);
    }

    juce::Result convertLinearGradient(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        const auto* props = objectProperties(value);
        if (props == nullptr)
            return juce::Result::fail("linear gradient must be an object");

        auto startPoint = relativePoint(0.0, 0.0);
        auto endPoint = relativePoint(1.0, 1.0);

        if (const auto angle = readNumber(firstPresent(*props, { "angle", "rotation" })))
        {
            const auto radians = *angle * kPi / 180.0;
            const auto dx = 0.5 * std::cos(radians);
            const auto dy = 0.5 * std::sin(radians);
            startPoint = relativePoint(0.5 - dx, 0.5 - dy);
            endPoint = relativePoint(0.5 + dx, 0.5 + dy);
        }

        if (props->contains("startPoint"))
            startPoint = readRelativePoint((*props)["startPoint"], 0.0, 0.0);
        if (props->contains("endPoint"))
            endPoint = readRelativePoint((*props)["endPoint"], 1.0, 1.0);

        return emitGradient("<LinearGradientBrush StartPoint=\"" + startPoint + "\" EndPoint=\"" + endPoint + "\">",
                            "LinearGradientBrush",
                            *props,
                            options,
                            out);
    }

    juce::Result convertRadialGradient(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        const auto* props = objectProperties(value);
        if (props == nullptr)
            return juce::Result::fail("radial gradient must be an object");

        const auto center = readRelativePoint(firstPresent(*props, { "center" }), 0.5, 0.5);
        const auto origin = props->contains("origin") ? readRelativePoint((*props)["origin"], 0.5, 0.5) : center;
        const auto radius = numberOr(*props, { "radius" }, 0.5);
        const auto radiusX = formatPercent(numberOr(*props, { "radiusX" }, radius));
        const auto radiusY = formatPercent(numberOr(*props, { "radiusY" }, radius));

        return emitGradient("<RadialGradientBrush Center=\"" + center + "\" GradientOrigin=\"" + origin
                                + "\" RadiusX=\"" + radiusX + "\" RadiusY=\"" + radiusY + "\">",
                            "RadialGradientBrush",
                            *props,
                            options,
                            out);
    }

    juce::Result convertImageBrush(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        const auto* props = objectProperties(value);
        if (props == nullptr)
            return juce::Result::fail("image brush must be an object");

        const auto source = varToText(firstPresent(*props, { "source", "src", "imageRef", "url" })).trim();
        if (source.isEmpty())
            return juce::Result::fail("image brush has no source");

        const auto mode = firstPresent(*props, { "stretch", "scaleMode" });
        OptionalResult stretch;
        if (!isAbsent(mode))
        {
            const auto stretchResult = convertStretch(mode, options, stretch);
            if (stretchResult.failed())
                return stretchResult;
        }

        auto line = "<ImageBrush Source=\"" + Saekim::Core::escapeMarkupValue(source)
                    + "\" Stretch=\"" + (stretch ? stretch->text : juce::String("UniformToFill")) + "\"";

        if (lettersOnly(varToText(mode)) == "tile")
            line << " TileMode=\"Tile\"";

        line << " />";
        return emit(out, line, true);
    }

    juce::Result convertBrush(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        if (const auto* props = objectProperties(value))
        {
            const auto type = lettersOnly(varToText(firstPresent(*props, { "type", "kind" })));

            if (type == "linear" || type == "lineargradient" || type == "gradientlinear")
                return convertLinearGradient(value, options, out);
            if (type == "radial" || type == "radialgradient" || type == "gradientradial")
                return convertRadialGradient(value, options, out);
            if (type == "image" || type == "imagebrush")
                return convertImageBrush(value, options, out);

            if (type.isEmpty() && (props->contains("stops") || props->contains("gradientStops")))
                return convertLinearGradient(value, options, out);

            const auto color = props->contains("color") ? (*props)["color"] : value;
            if (const auto hex = Saekim::Convert::colorToHex(color))
                return emit(out, *hex);

            return juce::Result::fail("brush object has no usable colour");
        }

        if (value.isString() && value.toString().trim().startsWithChar('{'))
            return emit(out, value.toString().trim());

        if (const auto hex = Saekim::Convert::colorToHex(value))
            return emit(out, *hex);

        return juce::Result::fail("'" + describe(value) + "' is not a colour");
    }

    juce::String convertGridLengthText(const juce::var& value)
    {
        if (const auto number = readNumber(value); number && !value.isString())
            return formatNumber(*number);

        const auto text = varToText(value).trim();
        const auto lower = text.toLowerCase();

        if (lower == "auto")
            return "Auto";
        if (text == "*" || text == "1*")
            return "*";

        if (text.endsWithChar('*'))
        {
            if (const auto weight = readNumber(juce::var(text.dropLastCharacters(1))))
                return formatNumber(*weight) + "*";
        }

        if (const auto number = readNumber(juce::var(text)))
            return formatNumber(*number);

        return text;
    }

    juce::Result convertGridLength(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        const auto text = convertGridLengthText(value);
        if (text.isEmpty())
            return juce::Result::fail("grid length is empty");
        return emit(out, text);
    }

    juce::Result convertDefinitions(const juce::var& value, const char* sizeKey, OptionalResult& out)
    {
        juce::StringArray lengths;

        if (const auto* array = value.getArray())
        {
            for (const auto& item : *array)
            {
                if (const auto* props = objectProperties(item))
                    lengths.add(convertGridLengthText(firstPresent(*props, { sizeKey, "size" })));
                else
                    lengths.add(convertGridLengthText(item));
            }
        }
        else if (value.isString())
        {
            juce::StringArray tokens;
            tokens.addTokens(value.toString(), ",", {});
            tokens.trim();
            for (const auto& token : tokens)
                lengths.add(convertGridLengthText(juce::var(token)));
        }
        else if (Saekim::isNumericVar(value))
        {
            // A bare count means that many star-sized definitions.
            const auto count = juce::jlimit(0, 256, static_cast<int>(value));
            for (int i = 0; i < count; ++i)
                lengths.add("*");
        }

        lengths.removeEmptyStrings();
        if (lengths.isEmpty())
            return juce::Result::fail("definition list is empty");

        return emit(out, lengths.joinIntoString(","));
    }

    juce::Result convertRowDefinitions(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertDefinitions(value, "height", out);
    }

    juce::Result convertColumnDefinitions(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        return convertDefinitions(value, "width", out);
    }

    std::optional<std::pair<double, double>> readPoint(const juce::var& value)
    {
        if (const auto* props = objectProperties(value))
        {
            const auto x = readNumber(firstPresent(*props, { "x" }));
            const auto y = readNumber(firstPresent(*props, { "y" }));
            if (x && y)
                return std::make_pair(*x, *y);
            return std::nullopt;
        }

        if (const auto numbers = readNumberList(value); numbers && numbers->size() == 2)
            return std::make_pair((*numbers)[0], (*numbers)[1]);

        return std::nullopt;
    }

    juce::Result convertPoint(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (const auto number = readNumber(value); number && !value.isString())
            return emit(out, formatNumber(*number) + "," + formatNumber(*number));

        if (const auto point = readPoint(value))
            return emit(out, formatNumber(point->first) + "," + formatNumber(point->second));

        if (value.isString() && value.toString().trim().isNotEmpty())
            return emit(out, collapseWhitespace(value.toString()).replace(", ", ","));

        return juce::Result::fail("'" + describe(value) + "' is not a point");
    }

    juce::Result convertGeometry(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        if (value.isString())
        {
            const auto data = collapseWhitespace(value.toString());
            if (data.isEmpty())
                return juce::Result::fail("geometry data is empty");
            return emit(out, data);
        }

        auto pointsVar = value;
        auto closed = false;
        if (const auto* props = objectProperties(value))
        {
            pointsVar = firstPresent(*props, { "points" });
            closed = static_cast<bool>(firstPresent(*props, { "closed" }));
        }

        const auto* points = pointsVar.getArray();
        if (points == nullptr || points->isEmpty())
            return juce::Result::fail("geometry needs path data or a point list");

        juce::StringArray segments;
        for (const auto& item : *points)
        {
            const auto point = readPoint(item);
            if (!point)
                return juce::Result::fail("geometry point '" + describe(item) + "' is invalid");

            segments.add((segments.isEmpty() ? "M " : "L ")
                         + formatNumber(point->first) + "," + formatNumber(point->second));
        }

        if (closed)
            segments.add("Z");

        return emit(out, segments.joinIntoString(" "));
    }

    std::optional<juce::String> effectElement(const juce::var& effect, juce::String& errorOut)
    {
        const auto* props = objectProperties(effect);
        if (props == nullptr)
        {
            errorOut = "effect must be an object";
            return std::nullopt;
        }

        if (props->contains("visible") && !static_cast<bool>((*props)["visible"]))
            return juce::String();

        const auto type = lettersOnly(varToText(firstPresent(*props, { "type", "kind" })));

        if (type == "dropshadow" || type == "shadow" || type == "outershadow")
        {
            auto offsetX = numberOr(*props, { "offsetX" }, 2.0);
            auto offsetY = numberOr(*props, { "offsetY" }, 2.0);
            if (const auto* offset = objectProperties(firstPresent(*props, { "offset" })))
            {
                offsetX = numberOr(*offset, { "x" }, offsetX);
                offsetY = numberOr(*offset, { "y" }, offsetY);
            }

            const auto blur = numberOr(*props, { "blurRadius", "radius", "blur" }, 4.0);
            const auto color = Saekim::Convert::colorToHex(firstPresent(*props, { "color" })).value_or("#000000");

            auto line = "<DropShadowEffect OffsetX=\"" + formatNumber(offsetX)
                        + "\" OffsetY=\"" + formatNumber(offsetY)
                        + "\" BlurRadius=\"" + formatNumber(blur)
                        + "\" Color=\"" + Saekim::Core::escapeMarkupValue(color) + "\"";

            const auto opacity = numberOr(*props, { "opacity" }, 1.0);
            if (opacity != 1.0)
                line << " Opacity=\"" << formatNumber(opacity) << "\"";

            return line + " />";
        }

        if (type == "blur" || type == "layerblur" || type == "gaussianblur")
            return "<BlurEffect Radius=\"" + formatNumber(numberOr(*props, { "radius", "blur" }, 4.0)) + "\" />";

        errorOut = "unsupported effect type '" + varToText(firstPresent(*props, { "type", "kind" })) + "'";
        return std::nullopt;
    }

    juce::Result convertEffect(const juce::var& value, const ConvertOptions&, OptionalResult& out)
    {
        juce::String error;

        if (const auto* effects = value.getArray())
        {
            for (const auto& effect : *effects)
            {
                const auto element = effectElement(effect, error);
                if (element && element->isNotEmpty())
                    return emit(out, *element, true);
            }

            if (error.isNotEmpty())
                return juce::Result::fail(error);
            return juce::Result::ok();
        }

        const auto element = effectElement(value, error);
        if (!element)
            return juce::Result::fail(error);
        if (element->isNotEmpty())
            return emit(out, *element, true);
        return juce::Result::ok();
    }

    void addRotate(juce::StringArray& elements, double angle)
    {
        if (angle != 0.0)
            elements.add("<RotateTransform Angle=\"" + formatNumber(angle) + "\" />");
    }

    void addScale(juce::StringArray& elements, double scaleX, double scaleY)
    {
        if (scaleX != 1.0 || scaleY != 1.0)
            elements.add("<ScaleTransform ScaleX=\"" + formatNumber(scaleX) + "\" ScaleY=\"" + formatNumber(scaleY) + "\" />");
    }

    void addSkew(juce::StringArray& elements, double angleX, double angleY)
    {
        if (angleX != 0.0 || angleY != 0.0)
            elements.add("<SkewTransform AngleX=\"" + formatNumber(angleX) + "\" AngleY=\"" + formatNumber(angleY) + "\" />");
    }

    void addTranslate(juce::StringArray& elements, double x, double y)
    {
        if (x != 0.0 || y != 0.0)
            elements.add("<TranslateTransform X=\"" + formatNumber(x) + "\" Y=\"" + formatNumber(y) + "\" />");
    }

    std::pair<double, double> readPair(const juce::NamedValueSet& props,
                                       const char* key,
                                       const char* keyX,
                                       const char* keyY,
                                       double fallback)
    {
        auto first = numberOr(props, { keyX }, fallback);
        auto second = numberOr(props, { keyY }, fallback);
        const auto combined = firstPresent(props, { key });

        if (const auto uniform = readNumber(combined); uniform && !combined.isString())
        {
            first = *uniform;
            second = *uniform;
        }
        else if (const auto point = readPoint(combined))
        {
            first = point->first;
            second = point->second;
        }

        return { first, second };
    }

    juce::Result convertTransform(const juce::var& value, const ConvertOptions& options, OptionalResult& out)
    {
        juce::StringArray elements;

        if (const auto* list = value.getArray())
        {
            for (const auto& item : *list)
            {
                const auto* props = objectProperties(item);
                if (props == nullptr)
                    return juce::Result::fail("transform entries must be objects");

                const auto type = lettersOnly(varToText(firstPresent(*props, { "type", "kind" })));
                if (type == "rotate" || type == "rotation")
                {
                    addRotate(elements, numberOr(*props, { "angle", "value" }, 0.0));
                }
                else if (type == "scale")
                {
                    const auto [scaleX, scaleY] = readPair(*props, "value", "x", "y", 1.0);
                    addScale(elements, scaleX, scaleY);
                }
                else if (type == "skew")
                {
                    const auto [angleX, angleY] = readPair(*props, "value", "x", "y", 0.0);
                    addSkew(elements, angleX, angleY);
                }
                else if (type == "translate")
                {
                    const auto [x, y] = readPair(*props, "value", "x", "y", 0.0);
                    addTranslate(elements, x, y);
                }
                else
                {
                    return juce::Result::fail("unsupported transform type '" + varToText(firstPresent(*props, { "type", "kind" })) + "'");
                }
            }
        }
        else if (const auto* props = objectProperties(value))
        {
            addRotate(elements, numberOr(*props, { "rotation", "rotate", "angle" }, 0.0));

            const auto [scaleX, scaleY] = readPair(*props, "scale", "scaleX", "scaleY", 1.0);
            addScale(elements, scaleX, scaleY);

            const auto [skewX, skewY] = readPair(*props, "skew", "skewX", "skewY", 0.0);
            addSkew(elements, skewX, skewY);

            const auto [translateX, translateY] = readPair(*props, "translate", "translateX", "translateY", 0.0);
            addTranslate(elements, translateX, translateY);
        }
        else
        {
            return juce::Result::fail("transform must be an object or a list");
        }

        if (elements.isEmpty())
            return juce::Result::ok();

        if (elements.size() == 1)
            return emit(out, elements[0], true);

        juce::StringArray lines;
        lines.add("<TransformGroup>");
        for (const auto& element : elements)
            lines.add(options.indentUnit + element);
        lines.add("</TransformGroup>");
        return emit(out, lines.joinIntoString("\n"), true);
    }
}

namespace Saekim::Convert
{
    juce::String converterKindToKey(ConverterKind kind)
    {
        for (const auto& entry : kKindKeys)
        {
            if (entry.kind == kind)
                return entry.key;
        }

        return "string";
    }

    std::optional<ConverterKind> converterKindFromKey(const juce::String& key)
    {
        const auto normalized = key.trim().toLowerCase();
        for (const auto& entry : kKindKeys)
        {
            if (normalized == entry.key)
                return entry.kind;
        }

        return std::nullopt;
    }

    bool isBindingExpression(const juce::String& text)
    {
        const auto trimmed = text.trim();
        if (!trimmed.startsWithChar('{') || !trimmed.endsWithChar('}'))
            return false;

        static const char* const prefixes[] = {
            "{Binding", "{CompiledBinding", "{ReflectionBinding", "{TemplateBinding",
            "{x:Bind", "{x:Static", "{x:Null", "{x:Type", "{StaticResource", "{DynamicResource"
        };

        for (const auto* prefix : prefixes)
        {
            if (!trimmed.startsWith(prefix))
                continue;

            const auto next = trimmed[static_cast<int>(std::strlen(prefix))];
            if (next == ' ' || next == '}' || next == ',')
                return true;
        }

        return false;
    }

    juce::String formatNumber(double value)
    {
        if (!std::isfinite(value))
            return {};

        const auto rounded = std::round(value);
        if (std::abs(value - rounded) < 1.0e-9 && std::abs(rounded) < 1.0e15)
        {
            if (rounded == 0.0)
                return "0";
            return juce::String(static_cast<juce::int64>(rounded));
        }

        auto text = juce::String(value, 6);
        if (text.containsChar('.'))
        {
            text = text.trimCharactersAtEnd("0");
            if (text.endsWithChar('.'))
                text = text.dropLastCharacters(1);
        }

        return text == "-0" ? juce::String("0") : text;
    }

    juce::String varToText(const juce::var& value)
    {
        if (isAbsent(value))
            return {};
        if (value.isBool())
            return static_cast<bool>(value) ? "true" : "false";
        if (isNumericVar(value))
            return formatNumber(static_cast<double>(value));
        if (value.isString())
            return value.toString();
        if (value.isArray() || value.isObject())
            return juce::JSON::toString(value, true);
        return value.toString();
    }

    std::optional<double> readNumber(const juce::var& value)
    {
        if (isNumericVar(value))
        {
            const auto numeric = static_cast<double>(value);
            if (!std::isfinite(numeric))
                return std::nullopt;
            return numeric;
        }

        if (!value.isString())
            return std::nullopt;

        const auto text = value.toString().trim();
        if (!isWellFormedNumber(text))
            return std::nullopt;

        const auto numeric = text.getDoubleValue();
        if (!std::isfinite(numeric))
            return std::nullopt;

        return numeric;
    }

    std::optional<juce::String> colorToHex(const juce::var& value)
    {
        if (const auto* props = objectProperties(value))
        {
            const auto red = readNumber(firstPresent(*props, { "r" }));
            const auto green = readNumber(firstPresent(*props, { "g" }));
            const auto blue = readNumber(firstPresent(*props, { "b" }));
            if (!red || !green || !blue)
                return std::nullopt;

            const auto alpha = numberOr(*props, { "a" }, 1.0);
            const auto rgb = hexByte(juce::roundToInt(*red)) + hexByte(juce::roundToInt(*green)) + hexByte(juce::roundToInt(*blue));
            if (alpha >= 1.0)
                return "#" + rgb;
            return "#" + hexByte(juce::roundToInt(juce::jlimit(0.0, 1.0, alpha) * 255.0)) + rgb;
        }

        if (!value.isString())
            return std::nullopt;

        const auto text = value.toString().trim();
        if (text.isEmpty())
            return std::nullopt;

        if (text.startsWithChar('#'))
        {
            const auto digits = text.substring(1);
            const auto length = digits.length();
            if ((length == 3 || length == 4 || length == 6 || length == 8) && digits.containsOnly("0123456789abcdefABCDEF"))
                return text;
            return std::nullopt;
        }

        const auto lower = text.toLowerCase();
        if (lower.startsWith("rgb"))
        {
            const auto body = text.fromFirstOccurrenceOf("(", false, false).upToLastOccurrenceOf(")", false, false);
            juce::StringArray channels;
            channels.addTokens(body, ", /", {});
            channels.removeEmptyStrings();

            if (channels.size() != 3 && channels.size() != 4)
                return std::nullopt;

            juce::String rgb;
            for (int i = 0; i < 3; ++i)
            {
                const auto channel = readNumber(juce::var(channels[i]));
                if (!channel)
                    return std::nullopt;
                rgb << hexByte(juce::roundToInt(*channel));
            }

            if (channels.size() == 3)
                return "#" + rgb;

            const auto alpha = readNumber(juce::var(channels[3]));
            if (!alpha)
                return std::nullopt;
            return "#" + hexByte(juce::roundToInt(juce::jlimit(0.0, 1.0, *alpha) * 255.0)) + rgb;
        }

        if (text.containsOnly("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"))
            return text;

        return std::nullopt;
    }

    bool ValueConverterSet::registerConverter(ConverterKind kind, ConverterFn converter)
    {
        if (!converter)
            return false;
        if (hasConverter(kind))
            return false;

        entries.push_back(Entry { kind, std::move(converter) });
        return true;
    }

    bool ValueConverterSet::hasConverter(ConverterKind kind) const noexcept
    {
        return std::any_of(entries.begin(),
                           entries.end(),
                           [kind](const Entry& entry)
                           {
                               return entry.kind == kind;
                           });
    }

    std::optional<ConverterResult> ValueConverterSet::convert(const juce::var& value,
                                                              ConverterKind kind,
                                                              const ConvertOptions& options) const
    {
        std::optional<ConverterResult> result;
        const auto status = tryConvert(value, kind, options, result);
        if (status.failed())
        {
            DBG("[Saekim] " + converterKindToKey(kind) + " converter rejected value: " + status.getErrorMessage());
            return std::nullopt;
        }

        return result;
    }

    juce::Result ValueConverterSet::tryConvert(const juce::var& value,
                                               ConverterKind kind,
                                               const ConvertOptions& options,
                                               std::optional<ConverterResult>& resultOut) const
    {
        resultOut.reset();

        if (isAbsent(value))
            return juce::Result::ok();

        if (value.isString() && isBindingExpression(value.toString()))
            return emit(resultOut, value.toString().trim());

        const auto it = std::find_if(entries.begin(),
                                     entries.end(),
                                     [kind](const Entry& entry)
                                     {
                                         return entry.kind == kind;
                                     });

        // Unknown kinds degrade to plain stringification.
        if (it == entries.end())
            return emit(resultOut, varToText(value));

        return it->converter(value, options, resultOut);
    }

    ValueConverterSet makeDefaultValueConverterSet()
    {
        ValueConverterSet converters;

        const std::pair<ConverterKind, ConverterFn> builtins[] = {
            { ConverterKind::string, convertString },
            { ConverterKind::integer, convertInteger },
            { ConverterKind::number, convertNumber },
            { ConverterKind::boolean, convertBoolean },
            { ConverterKind::nullableBoolean, convertNullableBoolean },
            { ConverterKind::dimension, convertDimension },
            { ConverterKind::binding, convertBinding },
            { ConverterKind::collection, convertCollection },
            { ConverterKind::orientation, convertOrientation },
            { ConverterKind::dock, convertDock },
            { ConverterKind::expandDirection, convertExpandDirection },
            { ConverterKind::selectionMode, convertSelectionMode },
            { ConverterKind::horizontalAlignment, convertHorizontalAlignment },
            { ConverterKind::verticalAlignment, convertVerticalAlignment },
            { ConverterKind::textAlignment, convertTextAlignment },
            { ConverterKind::textWrapping, convertTextWrapping },
            { ConverterKind::scrollBarVisibility, convertScrollBarVisibility },
            { ConverterKind::fontWeight, convertFontWeight },
            { ConverterKind::fontStyle, convertFontStyle },
            { ConverterKind::stretch, convertStretch },
            { ConverterKind::thickness, convertThickness },
            { ConverterKind::cornerRadius, convertCornerRadius },
            { ConverterKind::brush, convertBrush },
            { ConverterKind::gridLength, convertGridLength },
            { ConverterKind::rowDefinitions, convertRowDefinitions },
            { ConverterKind::columnDefinitions, convertColumnDefinitions },
            { ConverterKind::point, convertPoint },
            { ConverterKind::geometry, convertGeometry },
            { ConverterKind::linearGradient, convertLinearGradient },
            { ConverterKind::radialGradient, convertRadialGradient },
            { ConverterKind::imageBrush, convertImageBrush },
            { ConverterKind::effect, convertEffect },
            { ConverterKind::transform, convertTransform }
        };

        for (const auto& [kind, converter] : builtins)
        {
            if (!converters.registerConverter(kind, converter))
                DBG("[Saekim] Converter registration skipped for kind '" + converterKindToKey(kind) + "'.");
        }

        return converters;
    }

    const ValueConverterSet& defaultValueConverterSet()
    {
        static const auto converters = makeDefaultValueConverterSet();
        return converters;
    }
}
