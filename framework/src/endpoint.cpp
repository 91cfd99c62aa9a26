#include <meridian/endpoint.h>
#include <meridian/exceptions.h>
#include <unordered_set>

namespace meridian {

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const EndpointRecord& rec) {
    boost::json::object obj;
    obj["region"] = rec.region;
    obj["primary"] = rec.primary;
    obj["next_available_time"] = rec.next_available_time;
    if (rec.region_profile_prefix) {
        obj["region_profile_prefix"] = *rec.region_profile_prefix;
    }
    jv = std::move(obj);
}

EndpointRecord tag_invoke(boost::json::value_to_tag<EndpointRecord>, const boost::json::value& jv) {
    const auto& obj = jv.as_object();

    EndpointRecord rec;
    rec.region = boost::json::value_to<std::string>(obj.at("region"));
    rec.primary = obj.at("primary").as_bool();

    // Timestamps written by other tools may be floats or unsigned
    const auto& next = obj.at("next_available_time");
    if (next.is_int64()) {
        rec.next_available_time = next.get_int64();
    } else {
        rec.next_available_time = next.to_number<int64_t>();
    }

    if (auto it = obj.find("region_profile_prefix"); it != obj.end() && !it->value().is_null()) {
        rec.region_profile_prefix = boost::json::value_to<std::string>(it->value());
    }
    return rec;
}

EndpointSnapshot parse_endpoints(std::string_view text) {
    boost::json::error_code ec;
    boost::json::value root = boost::json::parse(text, ec);
    if (ec) {
        throw ConfigLoadFailed("Invalid endpoint JSON: " + ec.message());
    }
    if (!root.is_array()) {
        throw ConfigLoadFailed("Endpoint configuration must be a JSON array");
    }

    EndpointSnapshot records;
    records.reserve(root.as_array().size());
    std::unordered_set<std::string> seen;

    for (const auto& item : root.as_array()) {
        EndpointRecord rec;
        try {
            rec = boost::json::value_to<EndpointRecord>(item);
        } catch (const std::exception& e) {
            throw ConfigLoadFailed(std::string("Invalid endpoint record: ") + e.what());
        }
        if (rec.region.empty()) {
            throw ConfigLoadFailed("Endpoint record has an empty region");
        }
        if (!seen.insert(rec.region).second) {
            throw ConfigLoadFailed("Duplicate endpoint region: " + rec.region);
        }
        records.push_back(std::move(rec));
    }
    return records;
}

std::string serialize_endpoints(const EndpointSnapshot& records) {
    return boost::json::serialize(boost::json::value_from(records));
}

const EndpointRecord* find_endpoint(const EndpointSnapshot& records, std::string_view region) {
    for (const auto& rec : records) {
        if (rec.region == region) return &rec;
    }
    return nullptr;
}

} // namespace meridian
