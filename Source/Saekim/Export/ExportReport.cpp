#include "Saekim/Public/ExportTypes.h"

#include <algorithm>

namespace
{
    juce::String severityToString(Saekim::IssueSeverity severity)
    {
        switch (severity)
        {
            case Saekim::IssueSeverity::info: return "INFO";
            case Saekim::IssueSeverity::warning: return "WARN";
            case Saekim::IssueSeverity::error: return "ERROR";
        }

        return "INFO";
    }
}

namespace Saekim
{
    void ExportReport::addIssue(IssueSeverity severity, juce::String message)
    {
        if (severity == IssueSeverity::warning)
            ++warningCount;
        else if (severity == IssueSeverity::error)
            ++errorCount;

        issues.push_back(ExportIssue { severity, std::move(message) });
    }

    bool ExportReport::hasErrors() const noexcept
    {
        return errorCount > 0;
    }

    int ExportReport::countIssues(IssueSeverity severity) const noexcept
    {
        return static_cast<int>(std::count_if(issues.begin(),
                                              issues.end(),
                                              [severity](const ExportIssue& issue)
                                              {
                                                  return issue.severity == severity;
                                              }));
    }

    juce::String ExportReport::toText() const
    {
        juce::StringArray lines;
        lines.add("Saekim Export Report");
        lines.add("====================");
        lines.add("Class: " + className);
        lines.add("Root Element: " + rootElement);
        lines.add("Namespace: " + rootNamespace);
        lines.add("Components: " + juce::String(nodeCount));
        lines.add("Components Mapped: " + juce::String(supportedCount));
        lines.add("Components Unmapped: " + juce::String(unsupportedCount));
        lines.add("Properties Converted: " + juce::String(convertedPropertyCount));
        lines.add("Properties Skipped: " + juce::String(skippedPropertyCount));
        lines.add("Files: " + juce::String(fileCount));
        lines.add("Warnings: " + juce::String(warningCount));
        lines.add("Errors: " + juce::String(errorCount));
        lines.add("");
        lines.add("Issues:");

        if (issues.empty())
        {
            lines.add("- INFO: no issues");
        }
        else
        {
            for (const auto& issue : issues)
                lines.add("- " + severityToString(issue.severity) + ": " + issue.message);
        }

        lines.add("");
        return lines.joinIntoString("\n");
    }

    const ExportedFile* ExportResult::findFile(const juce::String& fileName) const noexcept
    {
        const auto it = std::find_if(files.begin(),
                                     files.end(),
                                     [&fileName](const ExportedFile& file)
                                     {
                                         return file.fileName == fileName;
                                     });
        return it == files.end() ? nullptr : &(*it);
    }
}
