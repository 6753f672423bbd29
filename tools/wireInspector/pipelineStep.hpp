#pragma once

namespace wirescan {

//! Page pipeline stage shown in the inspector. Stage values match the debug stage order of analysePage.
enum class PipelineStep { Extraction = 0, Classification = 1, Tracing = 2, All = 3 };

} // namespace wirescan
