#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/python.hpp"
#include "config.hpp"
#include "execution/chain.hpp"
#include "judge/grader.hpp"
using namespace std;
using namespace nlohmann;

static json read_json_file(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin)
        throw coderun::internal_error("Unable to open " + path.string());
    json j;
    fin >> j;
    return j;
}

/**
 * @brief 评测一个提交，输入格式：
 * {"code": "...", "language": "cpp", "testCases": [{"input": "...", "expectedOutput": "...", "hidden": false}],
 *  "options": {"compareMode": "strict", "ignoreWhitespace": false, "ignoreCase": false, "timeLimit": 8000}}
 */
static json grade_submission(const coderun::execution_chain &chain, const coderun::configuration &config, const json &j) {
    vector<coderun::test_case> test_cases;
    if (j.count("testCases") && j.at("testCases").is_array())
        j.at("testCases").get_to(test_cases);

    coderun::grade_options options;
    if (j.count("options"))
        j.at("options").get_to(options);

    coderun::grader judge(chain, config.time_limit_ms);
    return judge.grade(get_value_def<string>(j, "", "code"), get_value_def<string>(j, "", "language"), test_cases, options);
}

/**
 * @brief 运行一次代码，输入格式：{"code": "...", "language": "python", "stdin": "..."}
 */
static json run_code(const coderun::execution_chain &chain, const coderun::configuration &config, const json &j) {
    coderun::execution_result result = coderun::run_once(chain,
                                                         get_value_def<string>(j, "", "code"),
                                                         get_value_def<string>(j, "", "language"),
                                                         get_value_def<string>(j, "", "stdin"),
                                                         config.time_limit_ms);
    json output = result;
    output["status"] = coderun::classify_run_status(result);
    output["error"] = output["stderr"];
    return output;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("coderun options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from the given json file")
        ("submission", po::value<string>(), "grade the submission described by the given json file and print the result")
        ("run", po::value<string>(), "run the code described by the given json file once and print the result")
        ("service-url", po::value<string>(), "set the base url of the execution service. You can either pass it from environ SELF_URL, SERVER_URL, API_BASE_URL or RENDER_EXTERNAL_URL")
        ("compiler-api-url", po::value<string>(), "set the url of the compiler api. You can either pass it from environ COMPILER_API_URL")
        ("time-limit", po::value<int>(), "set the time limit in milliseconds of each execution, default to 8000")
        ("seed", po::value<unsigned long long>(), "set the random seed of the simulation fallback")
        ("no-sandbox", "do not run script code in the embedded interpreter")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "coderun: Execute untrusted code through a chain of backends and grade the output" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "coderun 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("submission") && !vm.count("run")) {
        cerr << "Either --submission or --run should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    coderun::configuration config;
    try {
        config = coderun::load_configuration(vm.count("config") ? vm.at("config").as<string>() : "");
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to load configuration: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    if (vm.count("service-url"))
        config.service.base_url = coderun::normalize_base_url(vm.at("service-url").as<string>());
    if (vm.count("compiler-api-url"))
        config.compiler_api.url = vm.at("compiler-api-url").as<string>();
    if (vm.count("time-limit")) {
        config.time_limit_ms = vm.at("time-limit").as<int>();
        if (config.time_limit_ms <= 0) {
            cerr << "--time-limit should be positive" << endl;
            return EXIT_FAILURE;
        }
    }
    if (vm.count("seed"))
        config.simulation_seed = vm.at("seed").as<unsigned long long>();
    if (vm.count("no-sandbox"))
        config.sandbox_enabled = false;

    curl_global_init(CURL_GLOBAL_ALL);
    coderun::embedded_interpreter interpreter;

    coderun::execution_chain chain = coderun::make_default_chain(config, coderun::curl_post, coderun::make_random_source(config.simulation_seed));

    int exit_code = EXIT_SUCCESS;
    try {
        if (vm.count("submission")) {
            json input = read_json_file(vm.at("submission").as<string>());
            cout << grade_submission(chain, config, input).dump(2) << endl;
        } else {
            json input = read_json_file(vm.at("run").as<string>());
            cout << run_code(chain, config, input).dump(2) << endl;
        }
    } catch (coderun::validation_error &e) {
        cout << json{{"status", "Runtime Error"}, {"error", e.what()}}.dump(2) << endl;
    } catch (coderun::coderun_exception &e) {
        LOG(ERROR) << "Unable to process request: " << e;
        exit_code = EXIT_FAILURE;
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to process request: " << boost::diagnostic_information(e);
        exit_code = EXIT_FAILURE;
    }

    curl_global_cleanup();
    return exit_code;
}
