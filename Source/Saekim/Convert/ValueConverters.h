#pragma once

#include "Saekim/Public/Types.h"
#include <functional>
#include <optional>
#include <vector>

namespace Saekim::Convert
{
    enum class ConverterKind
    {
        string,
        integer,
        number,
        boolean,
        nullableBoolean,
        dimension,
        binding,
        collection,
        orientation,
        dock,
        expandDirection,
        selectionMode,
        horizontalAlignment,
        verticalAlignment,
        textAlignment,
        textWrapping,
        scrollBarVisibility,
        fontWeight,
        fontStyle,
        stretch,
        thickness,
        cornerRadius,
        brush,
        gridLength,
        rowDefinitions,
        columnDefinitions,
        point,
        geometry,
        linearGradient,
        radialGradient,
        imageBrush,
        effect,
        transform
    };

    juce::String converterKindToKey(ConverterKind kind);
    std::optional<ConverterKind> converterKindFromKey(const juce::String& key);

    struct ConvertOptions
    {
        juce::String bindingMode { "TwoWay" };
        juce::String indentUnit { "    " };
    };

    // Either an attribute-safe scalar or a markup fragment that must be
    // emitted as a nested property element.
    struct ConverterResult
    {
        juce::String text;
        bool fragment = false;
    };

    using ConverterFn = std::function<juce::Result(const juce::var&, const ConvertOptions&, std::optional<ConverterResult>&)>;

    bool isBindingExpression(const juce::String& text);
    juce::String formatNumber(double value);
    juce::String varToText(const juce::var& value);
    std::optional<double> readNumber(const juce::var& value);
    std::optional<juce::String> colorToHex(const juce::var& value);

    class ValueConverterSet
    {
    public:
        bool registerConverter(ConverterKind kind, ConverterFn converter);
        bool hasConverter(ConverterKind kind) const noexcept;

        // nullopt for absent values and for values that cannot be represented.
        std::optional<ConverterResult> convert(const juce::var& value,
                                               ConverterKind kind,
                                               const ConvertOptions& options = {}) const;

        // Like convert(), but explains why a present value was rejected.
        // Absent values return ok() with resultOut left empty.
        juce::Result tryConvert(const juce::var& value,
                                ConverterKind kind,
                                const ConvertOptions& options,
                                std::optional<ConverterResult>& resultOut) const;

    private:
        struct Entry
        {
            ConverterKind kind = ConverterKind::string;
            ConverterFn converter;
        };

        std::vector<Entry> entries;
    };

    ValueConverterSet makeDefaultValueConverterSet();
    const ValueConverterSet& defaultValueConverterSet();
}
