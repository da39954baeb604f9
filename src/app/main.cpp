#include "objdet/config.hpp"
#include "objdet/errors.hpp"
#include "objdet/json_io.hpp"
#include "objdet/logger.hpp"
#include "objdet/prediction_pool.hpp"
#include "objdet/service_runtime.hpp"
#include "objdet/trt_engine.hpp"
#include "objdet/upload_gate.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace objdet;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        throw InvalidUploadError("Cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string contentTypeFor(const std::string& filename) {
    std::string ext = UploadGate::extensionOf(filename);
    if (ext == "jpg") ext = "jpeg";
    return ext.empty() ? std::string("application/octet-stream") : "image/" + ext;
}

void printReply(const std::string& file, int status, const nlohmann::json& body) {
    std::cout << nlohmann::json{{"file", file}, {"status", status}, {"body", body}}.dump()
              << std::endl;
}

template <typename T>
std::optional<T> optionalArg(const cxxopts::ParseResult& args, const std::string& name) {
    if (args.count(name)) return args[name].as<T>();
    return std::nullopt;
}

int runBatch(const ServiceRuntime& runtime, const std::vector<std::string>& images,
             size_t workers, std::optional<float> conf, std::optional<float> iou) {
    PredictionPool pool(runtime.service(), workers);
    pool.start();

    std::mutex print_mutex;
    int failures = 0;

    // Drains results while jobs are still being submitted; workers block on a full result queue
    std::thread consumer([&] {
        PoolResult result;
        while (pool.getResult(result)) {
            std::lock_guard<std::mutex> lock(print_mutex);
            if (result.ok) {
                printReply(result.name, 200, toJson(result.response));
            } else {
                printReply(result.name, httpStatusFor(result.error_kind), errorToJson(result.error));
                ++failures;
            }
        }
    });

    int next_id = 0;
    for (const auto& image : images) {
        try {
            std::string bytes = readFile(image);
            runtime.gate().check(image, contentTypeFor(image), bytes.size());

            PredictionJob job;
            job.id = next_id++;
            job.name = image;
            job.bytes.assign(bytes.begin(), bytes.end());
            job.conf_threshold = conf;
            job.iou_threshold = iou;
            if (!pool.submit(std::move(job))) {
                throw Error("Prediction pool stopped before " + image + " was queued");
            }
        } catch (const Error& e) {
            std::lock_guard<std::mutex> lock(print_mutex);
            printReply(image, e.httpStatus(), errorToJson(e.what()));
            ++failures;
        }
    }
    pool.finish();
    consumer.join();
    pool.stop();

    return failures;
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("objdet_cli", "Run the object detection service on image files");
    options.add_options()
        ("h,help", "Print help")
        ("m,model", "TensorRT engine path (overrides MODEL_PATH)", cxxopts::value<std::string>())
        ("n,name", "Model identifier reported in responses (overrides MODEL_NAME)", cxxopts::value<std::string>())
        ("l,labels", "Label file, one class per line (overrides LABELS_PATH)", cxxopts::value<std::string>())
        ("c,confidence", "Confidence threshold override [0, 1]", cxxopts::value<float>())
        ("iou", "IoU threshold override [0, 1]", cxxopts::value<float>())
        ("w,workers", "Concurrent prediction workers", cxxopts::value<size_t>()->default_value("1"))
        ("health", "Print health status after loading and exit")
        ("log-level", "error, warning, info or verbose", cxxopts::value<std::string>())
        ("images", "Image files", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"images"});
    options.positional_help("<image> [<image> ...]");

    try {
        auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        ServiceConfig config = ServiceConfig::fromEnvironment();
        if (args.count("model")) config.model.model_path = args["model"].as<std::string>();
        if (args.count("name")) config.model.model_name = args["name"].as<std::string>();
        if (args.count("labels")) config.model.class_names = loadClassNames(args["labels"].as<std::string>());
        if (args.count("log-level")) config.log_level = args["log-level"].as<std::string>();
        config.validate();

        ServiceRuntime runtime(config, std::make_unique<TrtEngine>());
        bool loaded = runtime.start();

        if (args.count("health")) {
            std::cout << runtime.healthReply().body.dump(2) << std::endl;
            return loaded ? 0 : 1;
        }

        if (!args.count("images")) {
            std::cerr << "Error: at least one image must be specified" << std::endl;
            std::cerr << options.help() << std::endl;
            return 1;
        }
        const auto images = args["images"].as<std::vector<std::string>>();
        const auto conf = optionalArg<float>(args, "confidence");
        const auto iou = optionalArg<float>(args, "iou");
        const size_t workers = args["workers"].as<size_t>();

        if (images.size() == 1 || workers <= 1) {
            int failures = 0;
            for (const auto& image : images) {
                Reply reply;
                try {
                    reply = runtime.handleUpload(image, contentTypeFor(image), readFile(image), conf, iou);
                } catch (const Error& e) {
                    reply = Reply{e.httpStatus(), errorToJson(e.what())};
                }
                printReply(image, reply.status, reply.body);
                if (reply.status != 200) ++failures;
            }
            return failures == 0 ? 0 : 1;
        }

        if (!loaded) {
            for (const auto& image : images) {
                printReply(image, 503, errorToJson("Model not loaded. Service unavailable."));
            }
            return 1;
        }
        return runBatch(runtime, images, workers, conf, iou) == 0 ? 0 : 1;
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return 1;
    } catch (const Error& e) {
        logError(std::string(errorKindName(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        logError(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
