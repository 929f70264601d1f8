#pragma once

#include "Saekim/Public/ExportTypes.h"

namespace Saekim::Export
{
    juce::Result ensureDirectory(const juce::File& directory);

    // Writes with LF line endings and no BOM.
    juce::Result writeTextFile(const juce::File& file, const juce::String& text, bool overwriteExisting);

    // Writes every file of a successful export below outputDirectory, creating
    // subdirectories ("ViewModels/", "Views/") as needed. Relative names only.
    // Names and existing-file conflicts are checked before anything is written.
    juce::Result writeExportedFiles(const ExportResult& result,
                                    const juce::File& outputDirectory,
                                    bool overwriteExisting,
                                    juce::Array<juce::File>* writtenFilesOut = nullptr);
}
