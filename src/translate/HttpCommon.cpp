#include "../utils/HttpCommon.hpp"

#include <cpr/cpr.h>

#include <cctype>
#include <cstdlib>

namespace
{

void apply_common(cpr::Session& s, const translate::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    if (cfg.cancel_flag)
    {
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            {
                auto flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
                return flag && flag->load();
            },
            reinterpret_cast<intptr_t>(cfg.cancel_flag)));
    }
}

bool iequals(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return i == a.size() && b[i] == '\0';
}

cpr::Header make_header(const std::vector<translate::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (!has_ct && iequals(kv.name, "Content-Type"))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

translate::HttpResponse to_response(cpr::Response&& r)
{
    translate::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT && hr.error.find("timeout") == std::string::npos)
            hr.error = "request timeout: " + hr.error;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);

    // cpr::Header compares keys case-insensitively.
    auto it = r.header.find("Retry-After");
    if (it != r.header.end())
    {
        char* end = nullptr;
        const double seconds = std::strtod(it->second.c_str(), &end);
        if (end != it->second.c_str() && seconds > 0.0)
            hr.retry_after_seconds = seconds;
    }
    return hr;
}

} // namespace

namespace translate
{

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    return to_response(s.Post());
}

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ false));
    apply_common(s, cfg);
    return to_response(s.Get());
}

} // namespace translate
