#include "placer/core/Errors.hpp"

#include <iostream>

namespace placer::core
{
const char* ErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::LoadFailure: return "LoadFailure";
        case ErrorKind::PersistenceFailure: return "PersistenceFailure";
        case ErrorKind::CancellationFailure: return "CancellationFailure";
        case ErrorKind::InitializationFailure: return "InitializationFailure";
    }
    return "Unknown";
}

void SessionCallbacks::ReportError(ErrorKind kind, const std::string& message) const
{
    std::cerr << "[" << ErrorKindName(kind) << "] " << message << "\n";
    if (onError)
    {
        onError(ErrorReport{kind, message});
    }
}

void SessionCallbacks::NotifySelection(const std::optional<std::string>& assetId) const
{
    if (onAssetSelected)
    {
        onAssetSelected(assetId);
    }
}
} // namespace placer::core
