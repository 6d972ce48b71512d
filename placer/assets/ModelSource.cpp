#include "placer/assets/ModelSource.hpp"

namespace placer::assets
{
bool IsAbsoluteUrl(const std::string& url)
{
    return url.rfind("http", 0) == 0;
}

std::string ResolveModelUrl(const std::string& url, const std::string& base)
{
    if (IsAbsoluteUrl(url) || base.empty())
    {
        return url;
    }
    const std::string relative = (!url.empty() && url.front() == '/') ? url.substr(1) : url;
    if (base.back() == '/')
    {
        return base + relative;
    }
    return base + "/" + relative;
}
} // namespace placer::assets
