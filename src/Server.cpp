#include "resinslice/Server.hpp"
#include "resinslice/EnvironmentHandler.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/JsonCodec.hpp"
#include "resinslice/Logger.hpp"
#include <httplib.h>

#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>

using json = nlohmann::json;

namespace resinslice {

    namespace {
        // Runs one job handler and maps failures onto HTTP status codes.
        void respond(const char* route, const httplib::Request& req, httplib::Response& res,
                     const std::function<json(const JobRequest&)>& handler) {
            Logger::info(std::string("Received ") + route + " POST request");
            try {
                JobRequest request = JsonCodec::parseJobRequest(json::parse(req.body),
                                                                EnvironmentHandler::instance());
                res.set_content(handler(request).dump(), "application/json");
            } catch (const json::parse_error& e) {
                Logger::error(std::string("Error in ") + route + ": " + e.what());
                res.status = 400;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            } catch (const InputContractViolation& e) {
                Logger::error(std::string("Error in ") + route + ": " + e.what());
                res.status = 400;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            } catch (const ResourceExhaustion& e) {
                Logger::error(std::string("Error in ") + route + ": " + e.what());
                res.status = 507;
                res.set_content(json{{"error", e.what()},
                                     {"attempted", e.attempted()},
                                     {"available", e.available()}}.dump(), "application/json");
            } catch (const std::exception& e) {
                Logger::error(std::string("Error in ") + route + ": " + e.what());
                res.status = 500;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            }
        }
    }

    Server::Server(std::shared_ptr<SliceService> service) : service(std::move(service)) {
        if (!this->service) {
            throw std::invalid_argument("Server requires a slice service");
        }
    }

    void Server::start(int port) {
        httplib::Server svr;

        Logger::info("Server started on port " + std::to_string(port));

        // Health check endpoint
        svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(json{{"status", "healthy"},
                                 {"service", "resinslice"},
                                 {"strategy", service->orchestrator().strategy().name()}}.dump(),
                            "application/json");
        });

        svr.Post("/slice", [this](const httplib::Request& req, httplib::Response& res) {
            respond("/slice", req, res, [this](const JobRequest& request) {
                return JsonCodec::toJson(service->run(request), true);
            });
        });

        svr.Post("/islands", [this](const httplib::Request& req, httplib::Response& res) {
            respond("/islands", req, res, [this](const JobRequest& request) {
                return JsonCodec::toJson(service->analyzeIslands(request), false);
            });
        });

        Logger::info("Server listening on port " + std::to_string(port));
        if (!svr.listen("0.0.0.0", port)) {
            throw std::runtime_error("Unable to listen on port " + std::to_string(port));
        }
    }

} // namespace resinslice
