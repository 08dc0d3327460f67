#include "engine/JobSerializer.hpp"

#include "utils/Json.hpp"

#include <yyjson.h>

#include <array>
#include <string_view>

namespace rf::engine
{

namespace
{

constexpr std::array<std::string_view, 6> kMetricKeys = {
    "download_rate",    "upload_rate",    "peers", "eta",
    "total_downloaded", "total_uploaded",
};

bool is_metric_key(std::string_view key)
{
    for (auto const &known : kMetricKeys)
    {
        if (known == key)
        {
            return true;
        }
    }
    return false;
}

void add_metrics(yyjson_mut_doc *doc, yyjson_mut_val *obj,
                 JobMetrics const &metrics)
{
    if (metrics.download_rate)
    {
        yyjson_mut_obj_add_real(doc, obj, "download_rate",
                                *metrics.download_rate);
    }
    if (metrics.upload_rate)
    {
        yyjson_mut_obj_add_real(doc, obj, "upload_rate", *metrics.upload_rate);
    }
    if (metrics.peers)
    {
        yyjson_mut_obj_add_int(doc, obj, "peers", *metrics.peers);
    }
    if (metrics.eta)
    {
        yyjson_mut_obj_add_int(doc, obj, "eta", *metrics.eta);
    }
    if (metrics.total_downloaded)
    {
        yyjson_mut_obj_add_int(doc, obj, "total_downloaded",
                               *metrics.total_downloaded);
    }
    if (metrics.total_uploaded)
    {
        yyjson_mut_obj_add_int(doc, obj, "total_uploaded",
                               *metrics.total_uploaded);
    }
    for (auto const &[key, value] : metrics.extra)
    {
        if (is_metric_key(key))
        {
            continue;
        }
        yyjson_mut_obj_add(obj, yyjson_mut_strncpy(doc, key.data(), key.size()),
                           yyjson_mut_strncpy(doc, value.data(), value.size()));
    }
}

JobMetrics read_metrics(yyjson_val *obj)
{
    JobMetrics metrics;
    if (obj == nullptr || !yyjson_is_obj(obj))
    {
        return metrics;
    }
    metrics.download_rate = rf::json::number_field(obj, "download_rate");
    metrics.upload_rate = rf::json::number_field(obj, "upload_rate");
    if (auto peers = rf::json::int_field(obj, "peers"))
    {
        metrics.peers = static_cast<int>(*peers);
    }
    metrics.eta = rf::json::int_field(obj, "eta");
    metrics.total_downloaded = rf::json::int_field(obj, "total_downloaded");
    metrics.total_uploaded = rf::json::int_field(obj, "total_uploaded");

    size_t idx, limit;
    yyjson_val *key = nullptr;
    yyjson_val *value = nullptr;
    yyjson_obj_foreach(obj, idx, limit, key, value)
    {
        std::string name(yyjson_get_str(key), yyjson_get_len(key));
        if (is_metric_key(name))
        {
            continue;
        }
        if (yyjson_is_str(value))
        {
            metrics.extra[name] =
                std::string(yyjson_get_str(value), yyjson_get_len(value));
        }
        else if (yyjson_is_int(value))
        {
            metrics.extra[name] = std::to_string(yyjson_get_sint(value));
        }
    }
    return metrics;
}

} // namespace

std::string serialize_metrics(JobMetrics const &metrics)
{
    rf::json::MutableDocument doc;
    auto *root = doc.make_object_root();
    if (root == nullptr)
    {
        return "{}";
    }
    add_metrics(doc.doc(), root, metrics);
    return doc.write();
}

JobMetrics deserialize_metrics(std::string const &payload)
{
    auto doc = rf::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return {};
    }
    return read_metrics(doc.root());
}

std::string serialize_job_status(JobStatus const &status)
{
    rf::json::MutableDocument doc;
    auto *root = doc.make_object_root();
    if (root == nullptr)
    {
        return "{}";
    }
    auto *native = doc.doc();
    yyjson_mut_obj_add_strcpy(native, root, "id", status.id.c_str());
    yyjson_mut_obj_add_strcpy(native, root, "title", status.title.c_str());
    yyjson_mut_obj_add_strcpy(native, root, "quality", status.quality.c_str());
    auto state = std::string(to_string(status.state));
    yyjson_mut_obj_add_strcpy(native, root, "state", state.c_str());
    yyjson_mut_obj_add_real(native, root, "progress", status.progress);
    yyjson_mut_obj_add_strcpy(native, root, "magnet", status.magnet.c_str());
    yyjson_mut_obj_add_strcpy(native, root, "source_url",
                              status.source_url.c_str());
    yyjson_mut_obj_add_strcpy(native, root, "save_path",
                              status.save_path.c_str());
    auto *sizes = yyjson_mut_obj_add_arr(native, root, "sizes");
    for (auto const &size : status.sizes)
    {
        yyjson_mut_arr_add_strncpy(native, sizes, size.data(), size.size());
    }
    if (status.error_message)
    {
        yyjson_mut_obj_add_strcpy(native, root, "error_message",
                                  status.error_message->c_str());
    }
    else
    {
        yyjson_mut_obj_add_null(native, root, "error_message");
    }
    auto *metrics = yyjson_mut_obj_add_obj(native, root, "metrics");
    add_metrics(native, metrics, status.metrics);
    yyjson_mut_obj_add_bool(native, root, "streaming", status.streaming);
    yyjson_mut_obj_add_bool(native, root, "attached", status.attached);
    yyjson_mut_obj_add_int(native, root, "created_at", status.created_at);
    yyjson_mut_obj_add_int(native, root, "updated_at", status.updated_at);
    return doc.write();
}

std::optional<JobStatus> deserialize_job_status(std::string const &payload)
{
    auto doc = rf::json::Document::parse(payload);
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        return std::nullopt;
    }
    auto id = rf::json::string_field(root, "id");
    auto state_name = rf::json::string_field(root, "state");
    if (!id || id->empty() || !state_name)
    {
        return std::nullopt;
    }
    auto state = job_state_from_string(*state_name);
    if (!state)
    {
        return std::nullopt;
    }
    JobStatus status;
    status.id = *id;
    status.state = *state;
    status.title = rf::json::string_field(root, "title").value_or("");
    status.quality = rf::json::string_field(root, "quality").value_or("");
    status.progress = rf::json::number_field(root, "progress").value_or(0.0);
    status.magnet = rf::json::string_field(root, "magnet").value_or("");
    status.source_url = rf::json::string_field(root, "source_url").value_or("");
    status.save_path = rf::json::string_field(root, "save_path").value_or("");
    status.sizes = rf::json::string_array(yyjson_obj_get(root, "sizes"));
    status.error_message = rf::json::string_field(root, "error_message");
    status.metrics = read_metrics(yyjson_obj_get(root, "metrics"));
    status.streaming = rf::json::bool_field(root, "streaming").value_or(false);
    status.attached = rf::json::bool_field(root, "attached").value_or(false);
    status.created_at = rf::json::int_field(root, "created_at").value_or(0);
    status.updated_at = rf::json::int_field(root, "updated_at").value_or(0);
    return status;
}

} // namespace rf::engine
