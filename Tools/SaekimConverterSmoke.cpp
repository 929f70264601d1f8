#include <juce_core/juce_core.h>

#include "Saekim/Convert/ValueConverters.h"

#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <vector>

namespace
{
    using Saekim::Convert::ConverterKind;

    juce::var makeObject(std::initializer_list<std::pair<const char*, juce::var>> properties)
    {
        auto* object = new juce::DynamicObject();
        for (const auto& [key, value] : properties)
            object->setProperty(key, value);
        return juce::var(object);
    }

    juce::var makeArray(std::initializer_list<juce::var> items)
    {
        juce::Array<juce::var> array;
        for (const auto& item : items)
            array.add(item);
        return juce::var(array);
    }

    juce::Result expectText(const juce::var& value, ConverterKind kind, const juce::String& expected)
    {
        const auto& converters = Saekim::Convert::defaultValueConverterSet();
        const auto result = converters.convert(value, kind);
        if (!result.has_value())
        {
            return juce::Result::fail(Saekim::Convert::converterKindToKey(kind) + " rejected "
                                      + Saekim::Convert::varToText(value) + ", expected " + expected);
        }

        if (result->text != expected)
        {
            return juce::Result::fail(Saekim::Convert::converterKindToKey(kind) + " produced '" + result->text
                                      + "', expected '" + expected + "'");
        }

        return juce::Result::ok();
    }

    juce::Result testConversionIsDeterministic()
    {
        const auto& converters = Saekim::Convert::defaultValueConverterSet();
        const std::vector<juce::var> samples {
            juce::var("Hello"),
            juce::var(12.5),
            juce::var(true),
            juce::var("#336699"),
            juce::var("4, 8"),
            makeObject({ { "left", 1 }, { "top", 2 }, { "right", 3 }, { "bottom", 4 } }),
            makeObject({ { "type", "linear" }, { "stops", makeArray({ "#FF0000", "#0000FF" }) } }),
            makeObject({ { "rotation", 30 }, { "scale", 2 } }),
            makeArray({ "Auto", "2*", 40 })
        };

        for (int kindIndex = 0; kindIndex <= static_cast<int>(ConverterKind::transform); ++kindIndex)
        {
            const auto kind = static_cast<ConverterKind>(kindIndex);
            if (!converters.hasConverter(kind))
                return juce::Result::fail("Missing converter: " + Saekim::Convert::converterKindToKey(kind));

            for (const auto& sample : samples)
            {
                std::optional<Saekim::Convert::ConverterResult> first;
                std::optional<Saekim::Convert::ConverterResult> second;
                const auto firstStatus = converters.tryConvert(sample, kind, {}, first);
                const auto secondStatus = converters.tryConvert(sample, kind, {}, second);

                if (firstStatus.failed() != secondStatus.failed()
                    || firstStatus.getErrorMessage() != secondStatus.getErrorMessage()
                    || first.has_value() != second.has_value()
                    || (first.has_value() && (first->text != second->text || first->fragment != second->fragment)))
                {
                    return juce::Result::fail("Non-deterministic " + Saekim::Convert::converterKindToKey(kind)
                                              + " conversion of " + Saekim::Convert::varToText(sample));
                }
            }
        }

        return juce::Result::ok();
    }

    juce::Result testPrimitiveConversion()
    {
        const auto& converters = Saekim::Convert::defaultValueConverterSet();

        if (converters.convert(juce::var(), ConverterKind::string).has_value())
            return juce::Result::fail("Absent value should not convert");

        if (converters.convert(juce::var(std::numeric_limits<double>::quiet_NaN()), ConverterKind::number).has_value())
            return juce::Result::fail("NaN should be rejected");

        for (const auto& check : {
                 expectText("TRUE", ConverterKind::boolean, "True"),
                 expectText(false, ConverterKind::boolean, "False"),
                 expectText(0.25, ConverterKind::number, "0.25"),
                 expectText(3.0, ConverterKind::number, "3"),
                 expectText("42px", ConverterKind::dimension, "42"),
                 expectText("auto", ConverterKind::dimension, "Auto"),
                 expectText(" 12 ", ConverterKind::integer, "12"),
                 expectText("-7.9", ConverterKind::integer, "-7"),
                 expectText("1.5e2", ConverterKind::number, "150"),
                 expectText("null", ConverterKind::nullableBoolean, "{x:Null}") })
        {
            if (check.failed())
                return check;
        }

        std::optional<Saekim::Convert::ConverterResult> rejected;
        if (converters.tryConvert("maybe", ConverterKind::boolean, {}, rejected).wasOk())
            return juce::Result::fail("'maybe' should not be accepted as a boolean");

        for (const auto& [text, kind] : std::initializer_list<std::pair<const char*, ConverterKind>> {
                 { "12abc", ConverterKind::integer },
                 { "1-2", ConverterKind::number },
                 { "1e", ConverterKind::number },
                 { ".", ConverterKind::number },
                 { "3..5px", ConverterKind::dimension } })
        {
            const auto status = converters.tryConvert(text, kind, {}, rejected);
            if (status.wasOk() || rejected.has_value())
                return juce::Result::fail("'" + juce::String(text) + "' should be rejected as malformed");
        }

        if (Saekim::Convert::readNumber(juce::var("1-2")).has_value())
            return juce::Result::fail("readNumber accepted trailing characters");

        return juce::Result::ok();
    }

    juce::Result testBindingPassthrough()
    {
        for (const auto& check : {
                 expectText("{Binding UserName}", ConverterKind::thickness, "{Binding UserName}"),
                 expectText("{StaticResource Primary}", ConverterKind::brush, "{StaticResource Primary}"),
                 expectText("Profile.Name", ConverterKind::binding, "{Binding Profile.Name, Mode=TwoWay}"),
                 expectText("lowercase", ConverterKind::binding, "lowercase"),
                 expectText("Items", ConverterKind::collection, "{Binding Items}") })
        {
            if (check.failed())
                return check;
        }

        Saekim::Convert::ConvertOptions oneWay;
        oneWay.bindingMode = "OneWay";
        const auto converted = Saekim::Convert::defaultValueConverterSet().convert("Total", ConverterKind::binding, oneWay);
        if (!converted.has_value() || converted->text != "{Binding Total, Mode=OneWay}")
            return juce::Result::fail("Binding mode option was not applied");

        return juce::Result::ok();
    }

    juce::Result testThicknessCollapse()
    {
        for (const auto& check : {
                 expectText(makeObject({ { "left", 4 }, { "top", 4 }, { "right", 4 }, { "bottom", 4 } }), ConverterKind::thickness, "4"),
                 expectText(makeObject({ { "left", 8 }, { "top", 2 }, { "right", 8 }, { "bottom", 2 } }), ConverterKind::thickness, "8,2"),
                 expectText(makeObject({ { "horizontal", 6 }, { "vertical", 6 } }), ConverterKind::thickness, "6"),
                 expectText("1, 2, 3, 4", ConverterKind::thickness, "1,2,3,4"),
                 expectText("4", ConverterKind::thickness, "4"),
                 expectText(makeObject({ { "topLeft", 3 }, { "topRight", 3 }, { "bottomRight", 3 }, { "bottomLeft", 3 } }), ConverterKind::cornerRadius, "3") })
        {
            if (check.failed())
                return check;
        }

        std::optional<Saekim::Convert::ConverterResult> rejected;
        if (Saekim::Convert::defaultValueConverterSet().tryConvert("1,2,3", ConverterKind::thickness, {}, rejected).wasOk())
            return juce::Result::fail("Three-value thickness should be rejected");

        return juce::Result::ok();
    }

    juce::Result testBrushConversion()
    {
        for (const auto& check : {
                 expectText("#336699", ConverterKind::brush, "#336699"),
                 expectText("rgb(255, 0, 0)", ConverterKind::brush, "#FF0000"),
                 expectText("rgba(0, 0, 0, 0.5)", ConverterKind::brush, "#80000000"),
                 expectText("Crimson", ConverterKind::brush, "Crimson"),
                 expectText(makeObject({ { "r", 0 }, { "g", 128 }, { "b", 255 } }), ConverterKind::brush, "#0080FF") })
        {
            if (check.failed())
                return check;
        }

        if (Saekim::Convert::defaultValueConverterSet().convert("#12345", ConverterKind::brush).has_value())
            return juce::Result::fail("Five-digit hex should be rejected");

        return juce::Result::ok();
    }

    juce::Result testMissingGradientStopsFallBack()
    {
        const auto& converters = Saekim::Convert::defaultValueConverterSet();

        for (const auto& [value, kind, element] : {
                 std::make_tuple(makeObject({ { "stops", makeArray({}) } }), ConverterKind::linearGradient, juce::String("LinearGradientBrush")),
                 std::make_tuple(makeObject({ { "type", "radial" }, { "stops", makeArray({}) } }), ConverterKind::brush, juce::String("RadialGradientBrush")),
                 std::make_tuple(makeObject({ { "type", "linear" } }), ConverterKind::brush, juce::String("LinearGradientBrush")) })
        {
            const auto result = converters.convert(value, kind);
            if (!result.has_value() || !result->fragment)
                return juce::Result::fail(element + " fallback did not produce a fragment");

            juce::StringArray lines;
            lines.addLines(result->text);

            if (lines.size() != 4
                || !lines[0].startsWith("<" + element)
                || lines[1].trim() != "<GradientStop Offset=\"0\" Color=\"White\" />"
                || lines[2].trim() != "<GradientStop Offset=\"1\" Color=\"Black\" />"
                || lines[3] != "</" + element + ">")
            {
                return juce::Result::fail("Unexpected gradient fallback:\n" + result->text);
            }
        }

        return juce::Result::ok();
    }

    juce::Result testTransformsAndEffects()
    {
        const auto& converters = Saekim::Convert::defaultValueConverterSet();

        const auto single = converters.convert(makeObject({ { "rotation", 45 } }), ConverterKind::transform);
        if (!single.has_value() || !single->fragment || single->text != "<RotateTransform Angle=\"45\" />")
            return juce::Result::fail("Single transform should collapse to one element");

        const auto grouped = converters.convert(makeObject({ { "rotation", 45 }, { "scale", 2 } }), ConverterKind::transform);
        if (!grouped.has_value()
            || !grouped->text.startsWith("<TransformGroup>")
            || !grouped->text.contains("<ScaleTransform ScaleX=\"2\" ScaleY=\"2\" />")
            || !grouped->text.endsWith("</TransformGroup>"))
        {
            return juce::Result::fail("Multiple transforms should be grouped");
        }

        const auto identity = converters.convert(makeObject({ { "rotation", 0 }, { "scale", 1 } }), ConverterKind::transform);
        if (identity.has_value())
            return juce::Result::fail("Identity transform should be omitted");

        const auto shadow = converters.convert(makeObject({ { "type", "dropShadow" }, { "blurRadius", 8 }, { "color", "#000000" } }),
                                               ConverterKind::effect);
        if (!shadow.has_value()
            || shadow->text != "<DropShadowEffect OffsetX=\"2\" OffsetY=\"2\" BlurRadius=\"8\" Color=\"#000000\" />")
        {
            return juce::Result::fail("Drop shadow effect not converted as expected");
        }

        std::optional<Saekim::Convert::ConverterResult> rejected;
        if (converters.tryConvert(makeObject({ { "type", "glow" } }), ConverterKind::effect, {}, rejected).wasOk())
            return juce::Result::fail("Unknown effect type should be rejected");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Conversion is deterministic", testConversionIsDeterministic },
        { "Primitive conversion", testPrimitiveConversion },
        { "Binding passthrough", testBindingPassthrough },
        { "Thickness collapse", testThicknessCollapse },
        { "Brush conversion", testBrushConversion },
        { "Missing gradient stops fall back", testMissingGradientStopsFallBack },
        { "Transforms and effects", testTransformsAndEffects }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Saekim converter smoke passed." << std::endl;
    return 0;
}
