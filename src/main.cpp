#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/evaluator.hpp"
#include "server/leaderboard.hpp"
#include "server/local/local.hpp"
#include "server/memory_store.hpp"
#include "server/reports.hpp"
#include "server/test_cases.hpp"
#include "worker.hpp"
using namespace std;
using namespace sortbot;
using nlohmann::json;

void sigintHandler(int /* signum */) {
    stop_workers();
}

/**
 * @brief 按照 命令行参数 -> 环境变量 -> 默认值 的顺序读取配置
 */
template <typename T>
static void read_option(const boost::program_options::variables_map& vm, const char* option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
    } else if (getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
    }
}

static unique_ptr<server::result_store> create_store(const filesystem::path& p) {
    json j = json::parse(read_file_content(p));
    string type = j.at("type").get<string>();
    if (type == "local") {
        auto store = make_unique<server::local::configuration>();
        store->init(p);
        return store;
    } else if (type == "memory") {
        auto store = make_unique<server::memory_store>();
        store->init(p);
        return store;
    } else {
        throw invalid_argument("Unrecognized configuration type " + type);
    }
}

static vector<filesystem::path> find_configurations(const vector<string>& servers) {
    vector<filesystem::path> config;
    for (auto& server : servers) {
        if (filesystem::is_directory(server)) {
            for (const auto& p : filesystem::directory_iterator(server)) {
                auto& path = p.path();
                if (path.extension() == ".json")
                    config.push_back(path);
            }
        } else if (filesystem::is_regular_file(server)) {
            config.emplace_back(server);
        } else {
            throw invalid_argument("Configuration file " + server + " does not exist");
        }
    }
    return config;
}

static server::result_store& select_store(const boost::program_options::variables_map& vm) {
    auto stores = registered_stores();
    if (stores.empty()) throw invalid_argument("No store enabled, use --enable");
    if (!vm.count("store")) return *stores.front();
    string category = vm["store"].as<string>();
    for (auto store : stores)
        if (store->category() == category) return *store;
    throw invalid_argument("Store " + category + " is not enabled");
}

static vector<test_case> read_battery(const boost::program_options::variables_map& vm) {
    if (vm.count("test-cases")) {
        return json::parse(read_file_content(vm["test-cases"].as<string>())).get<vector<test_case>>();
    } else if (vm.count("input-file")) {
        return server::load_test_cases(vm["input-file"].as<string>(), vm["size-category"].as<string>());
    } else {
        return server::sample_test_cases();
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("sortbot-judge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("code", po::value<string>(), "evaluate the sorting bot in the given Python file and print a JSON report")
        ("test-cases", po::value<string>(), "JSON file with the test cases to judge against, default to the sample battery")
        ("input-file", po::value<string>(), "file with one comma-separated integer array per line, used as test cases")
        ("size-category", po::value<string>()->default_value("small"), "size category of test cases loaded from --input-file")
        ("enable", po::value<vector<string>>(), "load store configurations, either a file or a directory with extension .json")
        ("threads", po::value<size_t>()->default_value(1), "number of judge worker threads pulling submissions from the enabled stores")
        ("store", po::value<string>(), "category of the store used by the store actions, default to the first enabled store")
        ("seed", "add the test cases given by --test-cases, --input-file or the sample battery to stores without test cases, and print the number added to each store")
        ("submit", po::value<string>(), "add the sorting bot in the given Python file to the store as a pending submission")
        ("bot-name", po::value<string>()->default_value("anonymous"), "name of the submitted bot")
        ("algorithm", po::value<string>(), "algorithm of the submitted bot, or the algorithm filter of --leaderboard")
        ("author", po::value<string>()->default_value(""), "author of the submitted bot")
        ("results", po::value<string>(), "print the bot, status, total score, error and results of the given submission")
        ("bots", "list the bots of the store")
        ("bot", po::value<string>(), "print the given bot with its latest code")
        ("resubmit", po::value<string>(), "submit the latest code of the given bot again as a pending submission")
        ("test-case-list", "list the test cases of the store without their data")
        ("leaderboard", "print the leaderboard of the store")
        ("limit", po::value<size_t>()->default_value(50), "maximum number of leaderboard entries or bots")
        ("offset", po::value<size_t>()->default_value(0), "number of leaderboard entries or bots to skip")
        ("category", po::value<string>(), "only rank submissions passing at least one test case of the given size category")
        ("timeout", po::value<double>(), "wall time limit in seconds for each test case, default to 30. You can either pass it from environ BOTTIMEOUT")
        ("python", po::value<string>(), "Python interpreter running the harness, default to python3. You can either pass it from environ PYTHON")
        ("run-dir", po::value<string>(), "set the directory to store generated harness files. You can either pass it from environ RUNDIR")
        ("memory-limit", po::value<int>(), "address space limit in MB of the harness, default to 128. You can either pass it from environ MAXMEMORYMB")
        ("max-processes", po::value<int>(), "maximum number of processes of the user running the harness, 0 for no limit, default to 1024. You can either pass it from environ MAXPROCESSES")
        ("output-limit", po::value<size_t>(), "bytes kept from each output stream of the harness, default to 1048576. You can either pass it from environ OUTPUTLIMIT")
        ("workers", po::value<size_t>(), "number of test cases judged concurrently in one submission, default to 1. You can either pass it from environ WORKERS")
        ("no-sandbox", "do not apply resource limits to the harness")
        ("debug", "turn on the debug mode, not to delete harness files to check the validity of generated programs.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "SortBot Judge: judge sorting bots written in Python" << endl
             << "Usage: " << argv[0] << " --code bot.py [options]" << endl
             << "       " << argv[0] << " --enable config.json [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sortbot-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        read_option(vm, "timeout", "BOTTIMEOUT", TIMEOUT);
        read_option(vm, "python", "PYTHON", PYTHON);
        read_option(vm, "memory-limit", "MAXMEMORYMB", MEMORY_LIMIT);
        read_option(vm, "output-limit", "OUTPUTLIMIT", OUTPUT_LIMIT);
        read_option(vm, "max-processes", "MAXPROCESSES", PROCESS_LIMIT);
        read_option(vm, "workers", "WORKERS", WORKERS);
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (TIMEOUT <= 0) {
        cerr << "Timeout should be positive" << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("run-dir")) {
        RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        RUN_DIR = filesystem::path(getenv("RUNDIR"));
    } else {
        RUN_DIR = filesystem::temp_directory_path() / "sortbot";
    }
    error_code ec;
    filesystem::create_directories(RUN_DIR, ec);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR.string() << " does not exist";

    if (vm.count("no-sandbox") || getenv("SANDBOXDISABLED")) {
        SANDBOX_ENABLED = false;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        DEBUG = true;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    evaluator eval(evaluator_config::from_globals());

    if (vm.count("code")) {
        try {
            evaluation_request request;
            request.sub_id = random_uuid();
            request.code = read_file_content(vm["code"].as<string>());
            request.test_cases = read_battery(vm);

            json report = eval.evaluate(request);
            cout << report.dump(2) << endl;
            return EXIT_SUCCESS;
        } catch (std::exception& e) {
            LOG(ERROR) << "Unable to evaluate " << vm["code"].as<string>() << ": " << e.what();
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    if (!vm.count("enable")) {
        cerr << "Either --code or --enable should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    try {
        for (const auto& p : find_configurations(vm.at("enable").as<vector<string>>()))
            register_store(create_store(p));
    } catch (std::exception& e) {
        LOG(ERROR) << "Malformed configuration: " << e.what();
        cerr << "Malformed configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("seed")) {
            vector<test_case> battery = read_battery(vm);
            json added = json::object();
            for (auto store : registered_stores())
                added[store->category()] = server::seed_store(*store, battery);
            cout << added.dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("submit")) {
            server::bot_info bot;
            bot.name = vm["bot-name"].as<string>();
            bot.author = vm["author"].as<string>();
            if (vm.count("algorithm")) bot.algorithm = vm["algorithm"].as<string>();
            string sub_id = select_store(vm).submit(bot, read_file_content(vm["submit"].as<string>()));
            cout << json({{"sub_id", sub_id}, {"status", get_status_name(submission_status::PENDING)}}).dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("results")) {
            auto& store = select_store(vm);
            server::submission_record record = store.get_submission(vm["results"].as<string>());
            cout << server::submission_report(record, store.get_test_cases()).dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("bots")) {
            auto& store = select_store(vm);
            json bots = server::list_bots(store.list_submissions(), vm["offset"].as<size_t>(), vm["limit"].as<size_t>());
            cout << bots.dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("bot") || vm.count("resubmit")) {
            auto& store = select_store(vm);
            string bot_id = vm.count("bot") ? vm["bot"].as<string>() : vm["resubmit"].as<string>();
            auto bot = server::find_bot(store.list_submissions(), bot_id);
            if (!bot) throw invalid_argument("Bot " + bot_id + " not found");

            if (vm.count("bot")) {
                json j = *bot;
                j["code"] = bot->latest_code;
                cout << j.dump(2) << endl;
            } else {
                string sub_id = store.submit(bot->bot, bot->latest_code);
                LOG(INFO) << "Resubmitted bot " << bot_id << " as submission " << sub_id;
                cout << json({{"sub_id", sub_id}, {"status", get_status_name(submission_status::PENDING)}}).dump(2) << endl;
            }
            return EXIT_SUCCESS;
        }

        if (vm.count("test-case-list")) {
            cout << server::test_case_list(select_store(vm).get_test_cases()).dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("leaderboard")) {
            auto& store = select_store(vm);
            server::leaderboard_filter filter;
            if (vm.count("category")) filter.size_category = vm["category"].as<string>();
            if (vm.count("algorithm")) filter.algorithm = vm["algorithm"].as<string>();
            filter.limit = vm["limit"].as<size_t>();
            filter.offset = vm["offset"].as<size_t>();
            json board = server::rank(store.list_submissions(), store.get_test_cases(), filter);
            cout << board.dump(2) << endl;
            return EXIT_SUCCESS;
        }
    } catch (std::exception& e) {
        LOG(ERROR) << e.what();
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    signal(SIGINT, sigintHandler);

    vector<thread> worker_threads;
    size_t threads = max<size_t>(vm["threads"].as<size_t>(), 1);
    for (size_t i = 0; i < threads; ++i)
        worker_threads.push_back(start_worker(i, eval));

    for (auto& th : worker_threads)
        th.join();

    return EXIT_SUCCESS;
}
