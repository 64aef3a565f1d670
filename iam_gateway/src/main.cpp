#include "gateway_api.hpp"
#include "http_server.hpp"
#include "memory_directory.hpp"
#include "rocks_directory.hpp"
#include "seed_loader.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static std::unique_ptr<rocksdb::DB> open_rocksdb(const std::string& path, int cache_mb) {
  rocksdb::Options opt;
  opt.create_if_missing = true;
  opt.IncreaseParallelism();

  // Small point lookups and prefix scans.
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = rocksdb::NewLRUCache(static_cast<size_t>(cache_mb) * 1024u * 1024u);
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
  table.cache_index_and_filter_blocks = true;
  opt.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));

  rocksdb::DB* raw = nullptr;
  auto st = rocksdb::DB::Open(opt, path, &raw);
  if (!st.ok()) {
    std::cerr << "Failed to open RocksDB at " << path << ": " << st.ToString() << "\n";
    return nullptr;
  }
  return std::unique_ptr<rocksdb::DB>(raw);
}

int main(int argc, char** argv) {
  std::string listen = "0.0.0.0:9100";
  std::string db_path;
  std::string seed_path;
  std::string config_path;
  std::string account_id(auth::kDefaultAccountId);
  int threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  int cache_mb = 64;
  int max_body_kb = 1024;
  bool sync = false;

  po::options_description desc("iam_gateway options");
  desc.add_options()
    ("help,h", "Show help")
    ("config", po::value<std::string>(&config_path), "INI-style file with any of the options below")
    ("listen", po::value<std::string>(&listen)->default_value(listen), "Listen address host:port")
    ("threads", po::value<int>(&threads)->default_value(threads), "Worker threads")
    ("db_path", po::value<std::string>(&db_path)->default_value(db_path), "RocksDB path; empty keeps the directory in memory")
    ("seed", po::value<std::string>(&seed_path)->default_value(seed_path), "JSON file of users, groups, roles, policies and sessions")
    ("account_id", po::value<std::string>(&account_id)->default_value(account_id), "Account id used in principal ARNs")
    ("cache_mb", po::value<int>(&cache_mb)->default_value(cache_mb), "RocksDB block cache (MiB)")
    ("max_body_kb", po::value<int>(&max_body_kb)->default_value(max_body_kb), "Max request body (KiB)")
    ("sync", po::bool_switch(&sync)->default_value(sync), "fsync directory writes");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("config")) {
      const auto& path = vm["config"].as<std::string>();
      std::ifstream in(path);
      if (!in) {
        std::cerr << "Cannot open config file " << path << "\n";
        return 2;
      }
      // Command-line values were stored first and take precedence.
      po::store(po::parse_config_file(in, desc), vm);
    }
    po::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << "Argument error: " << e.what() << "\n\n" << desc << "\n";
    return 2;
  }

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }

  // Parse listen
  auto colon = listen.rfind(':');
  if (colon == std::string::npos) {
    std::cerr << "--listen must be host:port\n";
    return 2;
  }
  std::string host = listen.substr(0, colon);
  int port_i = std::atoi(listen.substr(colon + 1).c_str());
  if (port_i <= 0 || port_i > 65535) {
    std::cerr << "Invalid port\n";
    return 2;
  }
  if (account_id.empty()) {
    std::cerr << "--account_id must not be empty\n";
    return 2;
  }

  server::Metrics metrics;

  std::unique_ptr<rocksdb::DB> db;
  std::unique_ptr<directory::Directory> dir;
  if (db_path.empty()) {
    dir = std::make_unique<directory::MemoryDirectory>();
  } else {
    db = open_rocksdb(db_path, std::max(1, cache_mb));
    if (!db) return 1;
    rocksdb::WriteOptions wo;
    wo.sync = sync;
    dir = std::make_unique<directory::RocksDirectory>(db.get(), wo, &metrics);
  }

  if (!seed_path.empty()) {
    std::string err;
    if (!directory::load_seed_file(*dir, seed_path, &err)) {
      std::cerr << "Failed to load seed " << seed_path << ": " << err << "\n";
      return 1;
    }
  }

  gateway::Config gcfg;
  gcfg.account_id = account_id;
  gateway::Api api(*dir, gcfg, &metrics);

  threads = std::max(1, threads);
  asio::io_context ioc{threads};

  boost::system::error_code addr_ec;
  auto address = asio::ip::make_address(host, addr_ec);
  if (addr_ec) {
    std::cerr << "Invalid listen address " << host << ": " << addr_ec.message() << "\n";
    return 2;
  }
  tcp::endpoint endpoint{address, static_cast<unsigned short>(port_i)};
  server::Config scfg;
  scfg.listen_host = host;
  scfg.listen_port = static_cast<unsigned short>(port_i);
  scfg.max_request_body_bytes = static_cast<size_t>(std::max(1, max_body_kb)) * 1024u;
  scfg.metrics = &metrics;

  auto listener = std::make_shared<server::Listener>(ioc, endpoint, api, scfg);
  if (!listener->ok()) return 1;
  listener->run();

  std::cout << "iam_gateway listening on " << listen
            << " directory=" << (db_path.empty() ? std::string("memory") : db_path)
            << " account=" << account_id
            << " threads=" << threads << std::endl;

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&ioc]{ ioc.run(); });
  }

  for (auto& t : workers) t.join();
  return 0;
}
