#include "engine/Error.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/TorrentManager.hpp"
#include "schedule/CronExpression.hpp"
#include "schedule/ScheduleManager.hpp"
#include "utils/Json.hpp"
#include "utils/StateStore.hpp"
#include "utils/Time.hpp"

#include "support/FakeCatalog.hpp"
#include "support/FakeEngine.hpp"
#include "support/TempRoot.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

using rf::schedule::ExecutionOutcome;

namespace
{

struct Harness
{
    explicit Harness(std::string_view tag,
                     rf::schedule::ScheduleManagerOptions options = fast())
        : root(rf::test::make_temp_root(tag)), database(root / "state.db"),
          torrents(&engine, &database, &bus, &catalog, torrent_options(root)),
          schedules(&database, &torrents, &catalog, &bus, options)
    {
    }

    static rf::schedule::ScheduleManagerOptions fast()
    {
        rf::schedule::ScheduleManagerOptions options;
        options.launch_stagger = std::chrono::milliseconds(0);
        options.shutdown_grace = std::chrono::milliseconds(2000);
        return options;
    }

    static rf::engine::TorrentManagerOptions
    torrent_options(std::filesystem::path const &root)
    {
        rf::engine::TorrentManagerOptions options;
        options.default_save_root = root / "downloads";
        options.autostart_loop = false;
        options.resume_data_timeout = std::chrono::milliseconds(100);
        return options;
    }

    std::string add(std::string quality = "1080p", int max_downloads = 1)
    {
        rf::schedule::ScheduleConfig config;
        config.name = "nightly";
        config.cron_expression = "0 3 * * *";
        config.criteria.genre = "drama";
        config.criteria.min_rating = 6.5;
        config.quality = std::move(quality);
        config.max_downloads = max_downloads;
        return schedules.add_schedule(config);
    }

    std::filesystem::path root;
    rf::storage::Database database;
    rf::test::FakeEngine engine;
    rf::engine::EventBus bus;
    rf::test::FakeCatalog catalog;
    rf::engine::TorrentManager torrents;
    rf::schedule::ScheduleManager schedules;
};

template <typename Fn> rf::ErrorKind kind_of(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (rf::Error const &ex)
    {
        return ex.kind();
    }
    FAIL("expected an rf::Error");
    return rf::ErrorKind::NotFound;
}

std::vector<std::string> titles_of(rf::engine::TorrentManager const &torrents)
{
    std::vector<std::string> titles;
    for (auto const &status : torrents.statuses())
    {
        titles.push_back(status.title);
    }
    std::sort(titles.begin(), titles.end());
    return titles;
}

} // namespace

TEST_CASE("add_schedule validates and computes the next run")
{
    Harness h("sm-add");
    auto before = rf::utils::unix_now();
    auto id = h.add();

    auto schedule = h.schedules.schedule(id);
    REQUIRE(schedule.has_value());
    CHECK(schedule->config.name == std::optional<std::string>("nightly"));
    CHECK(schedule->config.criteria.genre == "drama");
    CHECK(schedule->config.criteria.min_rating == doctest::Approx(6.5));
    CHECK(schedule->config.enabled);
    REQUIRE(schedule->next_run.has_value());
    CHECK(*schedule->next_run > before);
    CHECK(*schedule->next_run ==
          *rf::schedule::CronExpression::parse("0 3 * * *").next_after(
              schedule->created_at));
    CHECK_FALSE(schedule->last_run.has_value());
    CHECK(h.schedules.schedules().size() == 1);

    rf::schedule::ScheduleConfig bad;
    bad.cron_expression = "not a cron";
    CHECK(kind_of([&] { h.schedules.add_schedule(bad); }) ==
          rf::ErrorKind::Validation);
    bad.cron_expression = "0 3 * * *";
    bad.quality = "480p";
    CHECK(kind_of([&] { h.schedules.add_schedule(bad); }) ==
          rf::ErrorKind::Validation);
    bad.quality = "3D";
    bad.max_downloads = 0;
    CHECK(kind_of([&] { h.schedules.add_schedule(bad); }) ==
          rf::ErrorKind::Validation);
    CHECK(h.schedules.schedules().size() == 1);
}

TEST_CASE("update and delete report unknown schedules")
{
    Harness h("sm-update");
    auto id = h.add();

    rf::schedule::ScheduleConfig config;
    config.cron_expression = "@hourly";
    config.quality = "720p";
    config.max_downloads = 3;
    config.enabled = false;
    REQUIRE(h.schedules.update_schedule(id, config));
    auto schedule = h.schedules.schedule(id);
    REQUIRE(schedule.has_value());
    CHECK(schedule->config.cron_expression == "@hourly");
    CHECK(schedule->config.quality == "720p");
    CHECK(schedule->config.max_downloads == 3);
    CHECK_FALSE(schedule->config.enabled);
    CHECK_FALSE(schedule->config.name.has_value());

    CHECK_FALSE(h.schedules.update_schedule("missing", config));
    REQUIRE(h.schedules.delete_schedule(id));
    CHECK_FALSE(h.schedules.delete_schedule(id));
    CHECK_FALSE(h.schedules.schedule(id).has_value());
}

TEST_CASE("execution picks the highest rated candidates with the quality")
{
    Harness h("sm-select");
    h.catalog.candidates = {
        rf::test::make_candidate("Alpha", "9.1/10", {"720p"}),
        rf::test::make_candidate("Bravo", "8.7/10", {"720p", "1080p"}),
        rf::test::make_candidate("Charlie", "6.0/10", {"1080p"}),
        rf::test::make_candidate("Delta", "8.9", {"2160p"}),
        rf::test::make_candidate("Echo", "7.5/10", {"1080p", "2160p"}),
    };
    auto id = h.add("1080p", 2);

    std::vector<rf::engine::ScheduleExecutedEvent> events;
    h.bus.subscribe<rf::engine::ScheduleExecutedEvent>(
        [&](rf::engine::ScheduleExecutedEvent const &event)
        { events.push_back(event); });

    auto result = h.schedules.execute_schedule(id);
    CHECK(result.outcome == ExecutionOutcome::Completed);
    CHECK(result.summary.candidates_found == 5);
    CHECK(result.summary.candidates_selected == 2);
    CHECK(result.summary.selected_titles ==
          std::vector<std::string>{"Bravo", "Echo"});
    CHECK(result.summary.jobs_started == 2);
    CHECK(titles_of(h.torrents) == std::vector<std::string>{"Bravo", "Echo"});
    for (auto const &status : h.torrents.statuses())
    {
        CHECK(status.quality == "1080p");
    }
    REQUIRE(h.catalog.last_criteria.has_value());
    CHECK(h.catalog.last_criteria->genre == "drama");

    auto schedule = h.schedules.schedule(id);
    REQUIRE(schedule.has_value());
    CHECK(schedule->last_run_status ==
          std::optional<std::string>(rf::schedule::kStatusCompleted));
    REQUIRE(schedule->last_run.has_value());
    REQUIRE(schedule->next_run.has_value());
    CHECK(*schedule->next_run > *schedule->last_run);

    auto logs = h.schedules.logs(id);
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].status == rf::schedule::kStatusCompleted);
    REQUIRE(logs[0].results.has_value());
    auto doc = rf::json::Document::parse(*logs[0].results);
    REQUIRE(doc.is_valid());
    CHECK(rf::json::int_field(doc.root(), "movies_found") == 5);
    CHECK(rf::json::int_field(doc.root(), "movies_selected") == 2);
    CHECK(rf::json::int_field(doc.root(), "downloads_started") == 2);
    CHECK(rf::json::string_array(yyjson_obj_get(doc.root(), "selected_titles")) ==
          std::vector<std::string>{"Bravo", "Echo"});

    REQUIRE(events.size() == 1);
    CHECK(events[0].schedule_id == id);
    CHECK(events[0].job_ids.size() == 2);
}

TEST_CASE("an empty catalog completes without starting jobs")
{
    Harness h("sm-empty");
    auto id = h.add();
    auto result = h.schedules.execute_schedule(id);
    CHECK(result.outcome == ExecutionOutcome::NoCandidates);
    CHECK(h.torrents.statuses().empty());
    auto schedule = h.schedules.schedule(id);
    CHECK(schedule->last_run_status ==
          std::optional<std::string>(rf::schedule::kStatusNoCandidates));
    CHECK(schedule->next_run.has_value());
    auto logs = h.schedules.logs(id);
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].status == rf::schedule::kStatusNoCandidates);
}

TEST_CASE("a failing catalog records the error and still schedules the next run")
{
    Harness h("sm-error");
    h.catalog.fail_with = "catalog offline";
    auto id = h.add();

    auto result = h.schedules.execute_schedule(id);
    CHECK(result.outcome == ExecutionOutcome::Failed);
    CHECK(result.message == "catalog offline");
    auto schedule = h.schedules.schedule(id);
    REQUIRE(schedule.has_value());
    CHECK(schedule->last_run_status ==
          std::optional<std::string>("error: catalog offline"));
    CHECK(schedule->next_run.has_value());
    auto logs = h.schedules.logs(id);
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].status == "error");
    CHECK(logs[0].message == std::optional<std::string>("catalog offline"));

    // not stuck in "running"
    h.catalog.fail_with.reset();
    CHECK(h.schedules.execute_schedule(id).outcome ==
          ExecutionOutcome::NoCandidates);
}

TEST_CASE("a candidate that fails to start is skipped")
{
    Harness h("sm-partial");
    auto broken = rf::test::make_candidate("Broken", "9.5", {"1080p"});
    broken.torrents[0].magnet.clear();
    h.catalog.candidates = {
        broken,
        rf::test::make_candidate("Working", "8.0", {"1080p"}),
    };
    auto id = h.add("1080p", 2);
    auto result = h.schedules.execute_schedule(id);
    CHECK(result.outcome == ExecutionOutcome::Completed);
    CHECK(result.summary.candidates_selected == 2);
    CHECK(result.summary.jobs_started == 1);
    CHECK(titles_of(h.torrents) == std::vector<std::string>{"Working"});
}

TEST_CASE("the active download cap stops further launches")
{
    auto options = Harness::fast();
    options.max_active_downloads = 1;
    Harness h("sm-cap", options);
    h.catalog.candidates = {
        rf::test::make_candidate("One", "9.0", {"1080p"}),
        rf::test::make_candidate("Two", "8.0", {"1080p"}),
    };
    auto id = h.add("1080p", 2);
    auto result = h.schedules.execute_schedule(id);
    CHECK(result.outcome == ExecutionOutcome::Completed);
    CHECK(result.summary.jobs_started == 1);
    CHECK(titles_of(h.torrents) == std::vector<std::string>{"One"});
}

TEST_CASE("concurrent executions of one schedule: exactly one proceeds")
{
    Harness h("sm-concurrent");
    h.catalog.candidates = {rf::test::make_candidate("Solo", "7.0", {"1080p"})};
    auto id = h.add();

    h.catalog.hold();
    auto first = std::async(std::launch::async,
                            [&] { return h.schedules.execute_schedule(id); });
    REQUIRE(h.catalog.wait_for_browse(1, std::chrono::seconds(5)));
    CHECK(h.schedules.is_executing(id));

    auto second = h.schedules.execute_schedule(id);
    CHECK(second.outcome == ExecutionOutcome::AlreadyRunning);
    CHECK_FALSE(h.schedules.run_now(id, true));

    h.catalog.release();
    auto result = first.get();
    CHECK(result.outcome == ExecutionOutcome::Completed);
    CHECK(h.catalog.browse_calls.load() == 1);
    CHECK(h.torrents.statuses().size() == 1);
    CHECK_FALSE(h.schedules.is_executing(id));
}

TEST_CASE("the repository guard blocks a schedule another process is running")
{
    Harness h("sm-cas");
    auto id = h.add();
    REQUIRE(h.database.try_mark_schedule_running(id));

    auto result = h.schedules.execute_schedule(id);
    CHECK(result.outcome == ExecutionOutcome::AlreadyRunning);
    CHECK(h.catalog.browse_calls.load() == 0);
    CHECK(h.schedules.execute_schedule("missing").outcome ==
          ExecutionOutcome::NotFound);
}

TEST_CASE("poll_once launches due schedules in the background")
{
    Harness h("sm-poll");
    h.catalog.candidates = {rf::test::make_candidate("Due", "7.0", {"1080p"})};
    auto due = h.add();
    auto later = h.add();

    auto row = h.database.schedule(due);
    REQUIRE(row.has_value());
    auto const now = rf::utils::unix_now();
    row->next_run = now - 60;
    REQUIRE(h.database.update_schedule(*row));

    CHECK(h.schedules.poll_once(now) == 1);
    auto const deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((h.schedules.is_executing(due) || h.torrents.statuses().empty()) &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(titles_of(h.torrents) == std::vector<std::string>{"Due"});
    CHECK(h.schedules.schedule(due)->last_run.has_value());
    CHECK_FALSE(h.schedules.schedule(later)->last_run.has_value());

    // next_run moved into the future, so nothing is due now
    CHECK(h.schedules.poll_once(now) == 0);
}

TEST_CASE("shutdown marks a schedule left running as interrupted")
{
    Harness h("sm-interrupted");
    auto id = h.add();
    // a crashed run leaves the sentinel behind
    REQUIRE(h.database.try_mark_schedule_running(id));

    h.schedules.shutdown();

    auto schedule = h.schedules.schedule(id);
    REQUIRE(schedule.has_value());
    CHECK(schedule->last_run_status ==
          std::optional<std::string>(rf::schedule::kStatusInterrupted));
    CHECK(schedule->next_run.has_value());
    auto logs = h.schedules.logs(id);
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].status == rf::schedule::kStatusInterrupted);
    CHECK(logs[0].message ==
          std::optional<std::string>(rf::schedule::kInterruptedMessage));

    // due again once its time comes, and no longer blocked by the guard
    CHECK(h.database.due_schedules(*schedule->next_run).size() == 1);
    CHECK(h.database.try_mark_schedule_running(id));
}

TEST_CASE("shutdown interrupts an execution blocked in the catalog")
{
    auto options = Harness::fast();
    options.shutdown_grace = std::chrono::milliseconds(100);
    Harness h("sm-shutdown-inflight", options);
    h.catalog.candidates = {rf::test::make_candidate("Late", "7.0", {"1080p"})};
    auto id = h.add();

    h.catalog.hold();
    REQUIRE(h.schedules.run_now(id, true));
    REQUIRE(h.catalog.wait_for_browse(1, std::chrono::seconds(5)));

    h.schedules.shutdown();
    CHECK(h.schedules.schedule(id)->last_run_status ==
          std::optional<std::string>(rf::schedule::kStatusInterrupted));

    h.catalog.release();
}

TEST_CASE("start and shutdown drive the poll loop")
{
    Harness h("sm-loop");
    h.schedules.start();
    CHECK(h.schedules.running());
    h.schedules.shutdown();
    CHECK_FALSE(h.schedules.running());
}
