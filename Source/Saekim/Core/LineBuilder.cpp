#include "Saekim/Core/LineBuilder.h"

#include <algorithm>
#include <utility>

namespace Saekim::Core
{
    LineBuilder::LineBuilder(juce::String indentUnitIn)
        : unit(std::move(indentUnitIn))
    {
    }

    juce::String LineBuilder::makeIndentUnit(int indentSize, bool useTabs)
    {
        if (useTabs)
            return "\t";

        return juce::String::repeatedString(" ", juce::jlimit(1, 8, indentSize));
    }

    LineBuilder& LineBuilder::add(const juce::String& line)
    {
        return addAt(currentDepth, line);
    }

    LineBuilder& LineBuilder::addAt(int level, const juce::String& line)
    {
        if (line.isEmpty())
            buffer.add({});
        else
            buffer.add(indentation(level) + line);

        return *this;
    }

    LineBuilder& LineBuilder::addBlank()
    {
        buffer.add({});
        return *this;
    }

    LineBuilder& LineBuilder::addBlock(const juce::String& multiLineText)
    {
        return addBlockAt(currentDepth, multiLineText);
    }

    LineBuilder& LineBuilder::addBlockAt(int level, const juce::String& multiLineText)
    {
        juce::StringArray blockLines;
        blockLines.addLines(multiLineText);

        for (const auto& line : blockLines)
            addAt(level, line);

        return *this;
    }

    LineBuilder& LineBuilder::appendToLast(const juce::String& suffix)
    {
        if (buffer.isEmpty())
            buffer.add(suffix);
        else
            buffer.set(buffer.size() - 1, buffer[buffer.size() - 1] + suffix);

        return *this;
    }

    LineBuilder& LineBuilder::indent() noexcept
    {
        ++currentDepth;
        return *this;
    }

    LineBuilder& LineBuilder::outdent() noexcept
    {
        currentDepth = std::max(0, currentDepth - 1);
        return *this;
    }

    juce::String LineBuilder::indentation(int level) const
    {
        if (level <= 0)
            return {};

        return juce::String::repeatedString(unit, level);
    }

    juce::String LineBuilder::toString() const
    {
        return buffer.joinIntoString("\n");
    }
}
