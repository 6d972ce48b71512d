#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace placer::core
{
enum class ErrorKind
{
    LoadFailure,
    PersistenceFailure,
    CancellationFailure,
    InitializationFailure
};

struct ErrorReport
{
    ErrorKind kind = ErrorKind::LoadFailure;
    std::string message;
};

const char* ErrorKindName(ErrorKind kind);

// Callbacks the owning application receives from a scene session.
struct SessionCallbacks
{
    std::function<void(const std::optional<std::string>& assetId)> onAssetSelected;
    std::function<void(const ErrorReport& report)> onError;

    void ReportError(ErrorKind kind, const std::string& message) const;
    void NotifySelection(const std::optional<std::string>& assetId) const;
};

class CancellationToken
{
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { m_flag->store(true, std::memory_order_release); }
    [[nodiscard]] bool IsCancelled() const { return m_flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};
} // namespace placer::core
