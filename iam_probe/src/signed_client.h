#pragma once

#include "sigv4.hpp"
#include "util.hpp"

#include <string>

namespace iam_probe {

// Sends SigV4-signed requests to a gateway endpoint over libcurl.
class SignedClient {
public:
    struct Config {
        std::string endpoint; // e.g. http://127.0.0.1:9100
        std::string region = "us-east-1";
        long timeout_ms = 5000;
        long connect_timeout_ms = 2000;
        bool verify_tls = true;
    };

    struct Response {
        long status = 0;
        std::string body;
    };

    SignedClient(Config cfg, auth::Credentials creds);

    // Form-encoded POST of Action (+ params) to "/", signed for the given
    // query-protocol service (iam, sts, ec2, ...).
    bool Query(const std::string& service,
               const std::string& action,
               const util::Params& params,
               Response* out,
               std::string* err) const;

    // Object-store request signed for service "s3"; target is /bucket[/key].
    bool Storage(const std::string& method,
                 const std::string& target,
                 const std::string& body,
                 Response* out,
                 std::string* err) const;

    bool Send(const std::string& method,
              const std::string& target,
              const std::string& body,
              const std::string& content_type,
              const std::string& service,
              auth::SignerFlavor flavor,
              Response* out,
              std::string* err) const;

private:
    std::string HostHeader() const;

    Config cfg_;
    auth::Credentials creds_;
};

std::string FormEncode(const util::Params& params);

} // namespace iam_probe
