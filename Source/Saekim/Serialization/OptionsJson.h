#pragma once

#include "Saekim/Public/ExportTypes.h"

namespace Saekim::Serialization
{
    // Merges a flat options object onto optionsInOut. "preset" is applied first so
    // explicit keys win over the preset. Unknown keys and values of the wrong type
    // are skipped and listed in ignoredKeysOut when provided.
    juce::Result applyOptionOverrides(const juce::var& overrides,
                                      ExportOptions& optionsInOut,
                                      juce::StringArray* ignoredKeysOut = nullptr);

    juce::Result loadOptionsFromFile(const juce::File& file,
                                     ExportOptions& optionsInOut,
                                     juce::StringArray* ignoredKeysOut = nullptr);
}
