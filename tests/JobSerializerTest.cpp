#include "engine/JobSerializer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <doctest/doctest.h>

TEST_CASE("a status snapshot reads back")
{
    rf::engine::JobStatus status;
    status.id = "job-1";
    status.title = "Arrival";
    status.quality = "1080p";
    status.state = rf::engine::JobState::Downloading;
    status.progress = 37.5;
    status.magnet = "magnet:?xt=urn:btih:abc";
    status.save_path = "/downloads/Arrival";
    status.sizes = {"1.4 GB"};
    status.metrics.download_rate = 512.25;
    status.metrics.peers = 12;
    status.metrics.eta = 300;
    status.metrics.extra["year"] = "2016";
    status.attached = true;
    status.created_at = 1700000000;

    auto decoded =
        rf::engine::deserialize_job_status(rf::engine::serialize_job_status(status));
    REQUIRE(decoded.has_value());
    CHECK(decoded->id == "job-1");
    CHECK(decoded->state == rf::engine::JobState::Downloading);
    CHECK(decoded->progress == doctest::Approx(37.5));
    CHECK(decoded->sizes == std::vector<std::string>{"1.4 GB"});
    CHECK_FALSE(decoded->error_message.has_value());
    REQUIRE(decoded->metrics.download_rate.has_value());
    CHECK(*decoded->metrics.download_rate == doctest::Approx(512.25));
    CHECK(decoded->metrics.peers == std::optional<int>(12));
    CHECK(decoded->metrics.eta == std::optional<std::int64_t>(300));
    CHECK_FALSE(decoded->metrics.upload_rate.has_value());
    CHECK(decoded->metrics.extra.at("year") == "2016");
    CHECK(decoded->attached);
    CHECK(decoded->created_at == 1700000000);
}

TEST_CASE("snapshots without an id or a known state are rejected")
{
    CHECK_FALSE(rf::engine::deserialize_job_status("").has_value());
    CHECK_FALSE(rf::engine::deserialize_job_status("[]").has_value());
    CHECK_FALSE(
        rf::engine::deserialize_job_status("{\"state\":\"queued\"}").has_value());
    CHECK_FALSE(rf::engine::deserialize_job_status(
                    "{\"id\":\"a\",\"state\":\"sleeping\"}")
                    .has_value());
    auto minimal =
        rf::engine::deserialize_job_status("{\"id\":\"a\",\"state\":\"paused\"}");
    REQUIRE(minimal.has_value());
    CHECK(minimal->state == rf::engine::JobState::Paused);
    CHECK(minimal->title.empty());
}

TEST_CASE("metrics keep catalog metadata beside the numbers")
{
    auto metrics = rf::engine::deserialize_metrics(
        "{\"year\":2016,\"genre\":\"Drama\",\"peers\":4,\"eta\":null,"
        "\"download_rate\":1.5}");
    CHECK(metrics.peers == std::optional<int>(4));
    CHECK_FALSE(metrics.eta.has_value());
    REQUIRE(metrics.download_rate.has_value());
    CHECK(*metrics.download_rate == doctest::Approx(1.5));
    CHECK(metrics.extra.at("year") == "2016");
    CHECK(metrics.extra.at("genre") == "Drama");
    CHECK(metrics.extra.count("peers") == 0);
    CHECK(metrics.extra.count("eta") == 0);

    // extra entries never shadow a typed metric
    rf::engine::JobMetrics clash;
    clash.extra["peers"] = "many";
    clash.extra["genre"] = "Drama";
    auto reread =
        rf::engine::deserialize_metrics(rf::engine::serialize_metrics(clash));
    CHECK_FALSE(reread.peers.has_value());
    CHECK(reread.extra.size() == 1);

    CHECK(rf::engine::deserialize_metrics("garbage").extra.empty());
}
