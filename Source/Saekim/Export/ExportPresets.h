#pragma once

#include "Saekim/Public/ExportTypes.h"

namespace Saekim::Export
{
    // document: base unchanged; window/userControl: root element only;
    // project: userControl root with code-behind, view model and theme.
    ExportOptions withPreset(ExportPreset kind, ExportOptions base = {});
}
