#include "Saekim/Export/ExportWriter.h"

namespace
{
    bool isSafeRelativeName(const juce::String& fileName)
    {
        if (fileName.isEmpty() || juce::File::isAbsolutePath(fileName))
            return false;

        if (fileName.startsWithChar('/') || fileName.startsWithChar('\\'))
            return false;

        juce::StringArray parts;
        parts.addTokens(fileName, "/\\", {});
        return !parts.contains("..") && !parts.contains("");
    }
}

namespace Saekim::Export
{
    juce::Result ensureDirectory(const juce::File& directory)
    {
        if (directory.getFullPathName().isEmpty())
            return juce::Result::fail("Export output directory is empty");

        if (directory.exists())
        {
            if (!directory.isDirectory())
                return juce::Result::fail("Export output path is not a directory: " + directory.getFullPathName());
            return juce::Result::ok();
        }

        const auto created = directory.createDirectory();
        if (created.failed())
            return juce::Result::fail("Failed to create directory: " + directory.getFullPathName()
                                      + " (" + created.getErrorMessage() + ")");

        return juce::Result::ok();
    }

    juce::Result writeTextFile(const juce::File& file, const juce::String& text, bool overwriteExisting)
    {
        if (file.existsAsFile() && !overwriteExisting)
            return juce::Result::fail("Refusing to overwrite existing file: " + file.getFullPathName());

        if (!file.replaceWithText(text, false, false, "\n"))
            return juce::Result::fail("Failed to write file: " + file.getFullPathName());

        return juce::Result::ok();
    }

    juce::Result writeExportedFiles(const ExportResult& result,
                                    const juce::File& outputDirectory,
                                    bool overwriteExisting,
                                    juce::Array<juce::File>* writtenFilesOut)
    {
        if (!result.success)
            return juce::Result::fail("Nothing to write: " + result.error);

        for (const auto& exported : result.files)
        {
            if (!isSafeRelativeName(exported.fileName))
                return juce::Result::fail("Exported file name is not a relative path: " + exported.fileName);
        }

        const auto outputCheck = ensureDirectory(outputDirectory);
        if (outputCheck.failed())
            return outputCheck;

        // Every conflict is reported before the first write.
        for (const auto& exported : result.files)
        {
            const auto target = outputDirectory.getChildFile(exported.fileName);
            if (target.isDirectory())
                return juce::Result::fail("Export target is a directory: " + target.getFullPathName());
            if (target.existsAsFile() && !overwriteExisting)
                return juce::Result::fail("Refusing to overwrite existing file: " + target.getFullPathName());
        }

        for (const auto& exported : result.files)
        {
            const auto target = outputDirectory.getChildFile(exported.fileName);
            const auto parentCheck = ensureDirectory(target.getParentDirectory());
            if (parentCheck.failed())
                return parentCheck;

            const auto written = writeTextFile(target, exported.content, overwriteExisting);
            if (written.failed())
                return written;

            DBG("[Saekim] wrote " + target.getFullPathName());
            if (writtenFilesOut != nullptr)
                writtenFilesOut->add(target);
        }

        return juce::Result::ok();
    }
}
