#include "signed_client.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using iam_probe::SignedClient;

namespace {

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n";
    std::cerr << "Commands:\n";
    std::cerr << "  query --service name --action name [--param key=value ...]\n";
    std::cerr << "  storage --method verb --path /bucket[/key] [--data-file path]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --endpoint url (required, e.g. http://127.0.0.1:9100)\n";
    std::cerr << "  --access-key id (required)\n";
    std::cerr << "  --secret-key secret (required)\n";
    std::cerr << "  --session-token token (assumed-role credentials)\n";
    std::cerr << "  --region name (default us-east-1)\n";
    std::cerr << "  --timeout-ms n (default 5000)\n";
    std::cerr << "  --insecure (disable TLS verification)\n";
}

bool ReadFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    out = oss.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    auto get_arg = [&](const std::string& key) -> std::string {
        for (int i = 1; i < argc - 1; ++i) {
            if (argv[i] == key) {
                return argv[i + 1];
            }
        }
        return "";
    };

    SignedClient::Config cfg;
    cfg.endpoint = get_arg("--endpoint");
    if (!get_arg("--region").empty()) {
        cfg.region = get_arg("--region");
    }
    if (!get_arg("--timeout-ms").empty()) {
        cfg.timeout_ms = std::stol(get_arg("--timeout-ms"));
    }
    util::Params params;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--insecure") {
            cfg.verify_tls = false;
        }
        if (arg == "--param" && i + 1 < argc) {
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                std::cerr << "--param must be key=value\n";
                return 1;
            }
            params.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        }
    }

    auth::Credentials creds{get_arg("--access-key"), get_arg("--secret-key"), get_arg("--session-token")};
    if (cfg.endpoint.empty() || creds.access_key.empty() || creds.secret_key.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    SignedClient client(cfg, creds);
    SignedClient::Response resp;
    std::string err;
    bool sent = false;

    std::string command = argv[1];
    if (command == "query") {
        std::string service = get_arg("--service");
        std::string action = get_arg("--action");
        if (service.empty() || action.empty()) {
            PrintUsage(argv[0]);
            return 1;
        }
        sent = client.Query(service, action, params, &resp, &err);
    } else if (command == "storage") {
        std::string method = get_arg("--method");
        std::string path = get_arg("--path");
        std::string data_file = get_arg("--data-file");
        if (method.empty() || path.empty() || path.front() != '/') {
            PrintUsage(argv[0]);
            return 1;
        }
        std::string body;
        if (!data_file.empty() && !ReadFile(data_file, body)) {
            std::cerr << "Failed to read data file\n";
            return 1;
        }
        sent = client.Storage(method, path, body, &resp, &err);
    } else {
        PrintUsage(argv[0]);
        return 1;
    }

    if (!sent) {
        std::cerr << "Request failed: " << err << "\n";
        return 1;
    }
    std::cout << "status=" << resp.status << "\n";
    std::cout << resp.body << "\n";
    return (resp.status >= 200 && resp.status < 300) ? 0 : 2;
}
