#include "core/release_client.hpp"
#include "core/update_error.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

ReleaseClient::ReleaseClient(std::string api_base, std::string repo, HttpOptions http)
    : api_base_(std::move(api_base)), repo_(std::move(repo)), http_(std::move(http)) {
    while (!api_base_.empty() && api_base_.back() == '/') {
        api_base_.pop_back();
    }
    http_.headers.emplace_back("Accept", "application/vnd.github.v3+json");
}

std::string ReleaseClient::latest_release_url() const {
    return api_base_ + "/repos/" + repo_ + "/releases/latest";
}

ReleaseInfo ReleaseClient::fetch_latest_release() const {
    const std::string url = latest_release_url();

    HttpResponse res;
    try {
        res = HttpFetch::get(url, http_);
    } catch (const UpdateError& e) {
        throw UpdateError(UpdateErrorKind::RegistryUnavailable, e.detail());
    }

    if (!HttpFetch::is_success(res.status)) {
        throw UpdateError::http_status(UpdateErrorKind::RegistryUnavailable, res.status, url);
    }

    return parse_release(res.body);
}

ReleaseInfo ReleaseClient::parse_release(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw UpdateError(UpdateErrorKind::MalformedRelease,
                          std::string("release response is not valid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw UpdateError(UpdateErrorKind::MalformedRelease, "release response is not a JSON object");
    }

    auto tag = j.find("tag_name");
    if (tag == j.end() || !tag->is_string() || tag->get<std::string>().empty()) {
        throw UpdateError(UpdateErrorKind::MalformedRelease, "could not find tag_name in response");
    }

    ReleaseInfo info;
    info.tag = tag->get<std::string>();

    auto body_it = j.find("body");
    if (body_it != j.end() && body_it->is_string()) {
        info.changelog = body_it->get<std::string>();
    }

    auto assets = j.find("assets");
    if (assets != j.end() && assets->is_array()) {
        for (const auto& asset : *assets) {
            if (!asset.is_object()) continue;

            AssetInfo ai;
            auto name = asset.find("name");
            auto url = asset.find("browser_download_url");
            if (name == asset.end() || !name->is_string()) continue;
            ai.name = name->get<std::string>();
            if (url != asset.end() && url->is_string()) {
                ai.download_url = url->get<std::string>();
            }
            auto size = asset.find("size");
            if (size != asset.end() && size->is_number_integer()) {
                ai.size = size->get<int64_t>();
            }
            info.assets.push_back(std::move(ai));
        }
    }

    return info;
}
