#include "Saekim/Export/ExportPresets.h"

namespace Saekim::Export
{
    ExportOptions withPreset(ExportPreset kind, ExportOptions base)
    {
        base.preset = kind;

        switch (kind)
        {
            case ExportPreset::document:
                break;

            case ExportPreset::window:
                base.rootKind = RootKind::window;
                break;

            case ExportPreset::userControl:
                base.rootKind = RootKind::userControl;
                break;

            case ExportPreset::project:
                base.rootKind = RootKind::userControl;
                base.includeCodeBehind = true;
                base.includeViewModel = true;
                base.generateTheme = true;
                break;
        }

        return base;
    }
}
