#include <catch2/catch.hpp>

#include "resinslice/EnvironmentHandler.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Hasher.hpp"
#include "resinslice/JsonCodec.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/SliceService.hpp"

#include "test_utils.hpp"

#include <nlohmann/json.hpp>

using namespace resinslice;
using namespace resinslice::test;
using json = nlohmann::json;

namespace {

std::shared_ptr<InMemoryTriangleReader> make_reader()
{
    auto reader = std::make_shared<InMemoryTriangleReader>();
    reader->add("cube", cube_triangles());
    reader->add("floating", cube_triangles(1.0, {0, 0, 1}));
    return reader;
}

JobRequest cube_job()
{
    JobRequest job;
    ModelInput model;
    model.name = "cube";
    model.source = "cube";
    job.models.push_back(model);
    job.slice.width = 64;
    job.slice.height = 64;
    job.slice.thickness = 0.5;
    return job;
}

} // namespace

SCENARIO("SliceService runs the whole pipeline", "[Service]") {
    GIVEN("A service reading from memory") {
        SliceService service(make_reader(), std::make_shared<HostParallelStrategy>(2));

        WHEN("A unit cube is sliced") {
            JobResult result = service.run(cube_job());

            THEN("The body is summarized") {
                REQUIRE(result.bodies.size() == 1);
                REQUIRE(result.bodies[0].vertices == 8);
                REQUIRE(result.bodies[0].triangles == 12);
                REQUIRE(result.bodies[0].volume == Approx(1.0));
            }
            THEN("Two layers come back and no islands") {
                REQUIRE(result.slice.layers.size() == 2);
                REQUIRE(result.islands.size() == 1);
                REQUIRE(result.islands[0].report.islandIndices.empty());
            }
            THEN("The job id is a stable SHA-256") {
                REQUIRE(result.jobId.size() == 64);
                REQUIRE(service.run(cube_job()).jobId == result.jobId);
            }
        }

        WHEN("The cube is moved") {
            JobRequest moved = cube_job();
            moved.models[0].transform.position = Vec3(0, 0, 1);
            JobResult result = service.run(moved);
            THEN("Its bottom corners need support and the job id changes") {
                REQUIRE(result.islands[0].report.uniquePositions.size() == 4);
                REQUIRE(result.jobId != service.run(cube_job()).jobId);
            }
        }

        WHEN("Only islands are requested") {
            JobRequest job = cube_job();
            job.models[0].source = "floating";
            JobResult result = service.analyzeIslands(job);
            THEN("Nothing is sliced") {
                REQUIRE(result.slice.layers.empty());
                REQUIRE(result.islands[0].report.uniquePositions.size() == 4);
            }
        }

        WHEN("The request names no model") {
            JobRequest job = cube_job();
            job.models.clear();
            THEN("It is a contract violation") {
                REQUIRE_THROWS_AS(service.run(job), InputContractViolation);
            }
        }

        WHEN("Two models share a name") {
            JobRequest job = cube_job();
            job.models.push_back(job.models.front());
            job.models.back().source = "floating";
            THEN("The request is rejected before anything is sliced") {
                REQUIRE_THROWS_AS(service.run(job), InputContractViolation);
                REQUIRE_THROWS_AS(service.analyzeIslands(job), InputContractViolation);
            }
        }

        WHEN("A model source is unknown") {
            JobRequest job = cube_job();
            job.models[0].source = "missing";
            THEN("The reader error propagates") {
                REQUIRE_THROWS_AS(service.run(job), std::runtime_error);
            }
        }
    }

    GIVEN("A service with a tiny offload buffer") {
        SliceService service(make_reader(),
                             std::make_shared<BulkOffloadStrategy>(std::make_shared<ThreadPoolDevice>(2), 2));
        THEN("Resource exhaustion reaches the caller") {
            REQUIRE_THROWS_AS(service.run(cube_job()), ResourceExhaustion);
        }
    }
}

TEST_CASE("JsonCodec parses job requests", "[Service]") {
    EnvironmentHandler &env = EnvironmentHandler::instance();
    env.reset();

    SECTION("Defaults fill in missing settings") {
        JobRequest job = JsonCodec::parseJobRequest(json::parse(R"({"models": [{"path": "/tmp/a.stl"}]})"), env);
        REQUIRE(job.models.size() == 1);
        REQUIRE(job.models[0].source == "/tmp/a.stl");
        REQUIRE(job.models[0].enabled);
        REQUIRE(job.models[0].transform.isIdentity());
        REQUIRE(job.slice.width == env.getImageWidth());
        REQUIRE(job.slice.thickness == Approx(env.getSliceThickness()));
    }

    SECTION("Transforms and filters are read") {
        JobRequest job = JsonCodec::parseJobRequest(json::parse(R"({
            "models": [{"name": "a", "path": "a.stl", "position": [1, 2, 3], "rotation": [0, 0, 90],
                        "scale": [2, 2, 2], "enabled": false}],
            "width": 320, "height": 200, "thickness": 0.1, "bodies": ["a"]
        })"), env);
        REQUIRE(job.models[0].name == "a");
        REQUIRE_FALSE(job.models[0].enabled);
        REQUIRE(job.models[0].transform.position.z == Approx(3.0));
        REQUIRE(job.models[0].transform.rotation.z == Approx(90.0));
        REQUIRE(job.models[0].transform.scale.x == Approx(2.0));
        REQUIRE(job.slice.width == 320);
        REQUIRE(job.slice.height == 200);
        REQUIRE(job.slice.bodies == std::vector<std::string>{ "a" });
    }

    SECTION("Malformed requests are contract violations") {
        REQUIRE_THROWS_AS(JsonCodec::parseJobRequest(json::parse(R"({"width": 10})"), env), InputContractViolation);
        REQUIRE_THROWS_AS(JsonCodec::parseJobRequest(json::parse(R"({"models": [{"name": "x"}]})"), env),
                          InputContractViolation);
        REQUIRE_THROWS_AS(JsonCodec::parseJobRequest(
                              json::parse(R"({"models": [{"path": "a", "position": [1, 2]}]})"), env),
                          InputContractViolation);
        REQUIRE_THROWS_AS(JsonCodec::parseJobRequest(json::parse(R"({"models": [], "width": -4})"), env),
                          InputContractViolation);
        REQUIRE_THROWS_AS(JsonCodec::parseJobRequest(json::parse("[1, 2]"), env), InputContractViolation);
    }
}

TEST_CASE("JsonCodec summarizes job results", "[Service]") {
    SliceService service(make_reader(), std::make_shared<HostParallelStrategy>(1));
    JobResult result = service.run(cube_job());
    json out = JsonCodec::toJson(result, true);

    REQUIRE(out.at("job_id") == result.jobId);
    REQUIRE(out.at("bodies").size() == 1);
    REQUIRE(out.at("islands").at("cube").at("count") == 0);
    REQUIRE(out.at("slice").at("layers").size() == 2);
    REQUIRE(out.at("slice").at("layers")[0].at("image_hash").get<std::string>().size() == 64);
    REQUIRE(out.at("slice").at("stats").at("candidate_planes") == 3);

    REQUIRE_FALSE(JsonCodec::toJson(result, false).contains("slice"));
}

TEST_CASE("EnvironmentHandler overlays JSON configuration", "[Config]") {
    EnvironmentHandler &env = EnvironmentHandler::instance();
    env.reset();

    REQUIRE(env.getPort() == 8080);
    REQUIRE(env.getStrategy() == "host-parallel");

    env.loadJson(R"({"port": 9090, "strategy": "bulk-offload", "offload_capacity": 1024,
                     "image_width": 1920, "platform_z": 0.5, "log_level": "debug"})");
    REQUIRE(env.getPort() == 9090);
    REQUIRE(env.getStrategy() == "bulk-offload");
    REQUIRE(env.getOffloadCapacity() == 1024);
    REQUIRE(env.getImageWidth() == 1920);
    REQUIRE(env.getImageHeight() == 1620);
    REQUIRE(env.getPlatformZ() == Approx(0.5));

    SECTION("Invalid values are rejected") {
        REQUIRE_THROWS_AS(env.loadJson(R"({"strategy": "gpu"})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"slice_thickness": -1})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"port": "eighty"})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson("not json"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"image_width": -5})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"image_height": 0})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"image_width": 4294967296})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"workers": -1})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"offload_capacity": -3})"), std::runtime_error);
        REQUIRE_THROWS_AS(env.loadJson(R"({"port": 4294967297})"), std::runtime_error);
        REQUIRE(env.getImageWidth() == 1920);
        REQUIRE(env.getOffloadCapacity() == 1024);
        REQUIRE(env.getStrategy() == "bulk-offload");
        REQUIRE(env.getPort() == 9090);
    }

    env.reset();
}

TEST_CASE("Hasher produces SHA-256 hex digests", "[Hasher]") {
    REQUIRE(Hasher::sha256("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(Hasher::sha256("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE_THROWS_AS(Hasher::sha256_file("/nonexistent/file"), std::runtime_error);
}

TEST_CASE("Logger levels parse case-insensitively", "[Logger]") {
    REQUIRE(Logger::parseLevel("DEBUG") == LogLevel::Debug);
    REQUIRE(Logger::parseLevel("Warning") == LogLevel::Warn);
    REQUIRE_THROWS_AS(Logger::parseLevel("verbose"), std::runtime_error);

    const LogLevel previous = Logger::level();
    Logger::setLevel(LogLevel::Error);
    REQUIRE(Logger::level() == LogLevel::Error);
    Logger::setLevel(previous);
}
