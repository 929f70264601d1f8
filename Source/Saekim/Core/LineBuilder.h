#pragma once

#include <juce_core/juce_core.h>

namespace Saekim::Core
{
    // Ordered line buffer that prefixes every added line with the current
    // indentation. Blank lines are never indented.
    class LineBuilder
    {
    public:
        explicit LineBuilder(juce::String indentUnitIn = "    ");

        static juce::String makeIndentUnit(int indentSize, bool useTabs);

        LineBuilder& add(const juce::String& line);
        LineBuilder& addAt(int level, const juce::String& line);
        LineBuilder& addBlank();
        LineBuilder& addBlock(const juce::String& multiLineText);
        LineBuilder& addBlockAt(int level, const juce::String& multiLineText);
        LineBuilder& appendToLast(const juce::String& suffix);

        LineBuilder& indent() noexcept;
        LineBuilder& outdent() noexcept;
        int depth() const noexcept { return currentDepth; }

        juce::String indentation(int level) const;
        const juce::String& indentUnit() const noexcept { return unit; }

        bool isEmpty() const noexcept { return buffer.isEmpty(); }
        int size() const noexcept { return buffer.size(); }
        const juce::StringArray& lines() const noexcept { return buffer; }
        juce::String toString() const;

    private:
        juce::String unit;
        int currentDepth = 0;
        juce::StringArray buffer;
    };
}
