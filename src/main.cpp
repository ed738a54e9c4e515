#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <bequest/blake3/hash.hpp>
#include <bequest/common/critical.hpp>
#include <bequest/execution/ledger.hpp>
#include <bequest/schema/ledger_event_type.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace bequest::schema;

using encoder_t =
    bequest::schema::encoding::encoder<bequest::schema::encoding::scale_encoder_tag>;

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "bequest", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(level));
}

// Accepts either 64 hex characters or a name hashed into an account id.
account_id_t parse_account(const std::string_view value) {
  auto hex = value;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if (hex.size() == 2 * std::tuple_size_v<account_id_t>) {
    if (auto account = try_make_hash32(hex)) {
      return *account;
    }
  }
  return bequest::blake3::make_account_id(value);
}

void print_vault(const vault_state_t& vault,
                 const bequest::execution::ledger& ledger) {
  std::cout << "vault " << vault.vault_id << '\n'
            << "  owner:       " << to_hex(bytes_view_t{vault.owner}) << '\n';
  if (is_multi_beneficiary(vault)) {
    for (const auto& share : ledger.vault_beneficiaries(vault.vault_id)) {
      std::cout << "  share:       " << to_hex(bytes_view_t{share.beneficiary})
                << ' ' << share.percentage << "%\n";
    }
  } else {
    std::cout << "  beneficiary: " << to_hex(bytes_view_t{vault.beneficiary})
              << '\n';
  }
  std::cout << "  balance:     " << vault.balance.str() << '\n'
            << "  unlock_time: " << vault.unlock_time << '\n'
            << "  created_at:  " << vault.created_at << '\n'
            << "  claimed:     " << std::boolalpha << vault.claimed << '\n';
  if (vault.heartbeat_enabled) {
    std::cout << "  heartbeat:   every " << vault.heartbeat_interval
              << " ms, last " << vault.last_heartbeat_at << '\n';
  }
  if (!vault.note.empty()) {
    std::cout << "  note:        " << vault.note << '\n';
  }
}

void print_ids(const std::string_view label,
               const std::vector<vault_id_t>& ids) {
  std::cout << label << ':';
  for (const auto id : ids) {
    std::cout << ' ' << id;
  }
  std::cout << '\n';
}

void print_event(const ledger_event_t& event) {
  std::cout << event.event_id << ' ' << to_string(event.type) << " vault="
            << event.vault_id << " at=" << event.recorded_at;
  if (event.counterparty) {
    std::cout << " counterparty=" << to_hex(bytes_view_t{*event.counterparty});
  }
  if (event.amount) {
    std::cout << " amount=" << event.amount->str();
  }
  if (event.token_id) {
    std::cout << " token=" << *event.token_id;
  }
  if (event.unlock_time) {
    std::cout << " unlock_time=" << *event.unlock_time;
  }
  if (event.detail) {
    std::cout << " detail=" << *event.detail;
  }
  std::cout << '\n';
}

std::pair<event_id_t, event_id_t> parse_event_range(const std::string& range) {
  auto separator = range.find(':');
  if (separator == std::string::npos) {
    bequest::common::critical("--events expects FROM:TO");
  }
  try {
    return {std::stoull(range.substr(0, separator)),
            std::stoull(range.substr(separator + 1))};
  } catch (const std::exception& e) {
    spdlog::error("Invalid event range '{}': {}", range, e.what());
    bequest::common::critical("--events expects FROM:TO");
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Bequest ledger inspector"};
  description.add_options()("help,h", "Show the help message")(
      "db,d", po::value<std::string>(&db_path)->default_value("bequest.db"),
      "Path of the ledger database")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also write logs to this file")("stats", "Print ledger statistics")(
      "vault", po::value<vault_id_t>(), "Print one vault")(
      "owner", po::value<std::string>(),
      "List vaults owned by an account (name or hex)")(
      "beneficiary", po::value<std::string>(),
      "List vaults an account can receive from (name or hex)")(
      "token", po::value<token_id_t>(), "Print one inheritance token")(
      "overdue", po::value<vault_id_t>(),
      "Report whether a vault's heartbeat is overdue")(
      "events", po::value<std::string>(), "Print events FROM:TO inclusive")(
      "account", po::value<std::string>(),
      "Print the account id derived from a name");
  po::store(po::parse_command_line(argc, argv, description), vm);
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  configure_logging(log_level, log_file);

  if (vm.contains("account")) {
    auto account = parse_account(vm["account"].as<std::string>());
    std::cout << to_hex(bytes_view_t{account}) << '\n';
    spdlog::shutdown();
    return 0;
  }

  auto encoder = encoder_t{};
  // Inspection only: a mistyped path must fail instead of creating a ledger.
  auto storage =
      bequest::storage::make_storage<bequest::storage::rocksdb_storage_tag>(
          db_path, false);
  auto ledger = bequest::execution::ledger{encoder, storage};

  if (vm.contains("stats")) {
    auto stats = ledger.stats();
    std::cout << "total_vaults:     " << stats.total_vaults << '\n'
              << "total_tokens:     " << stats.total_tokens << '\n'
              << "total_escrowed:   " << stats.total_escrowed.str() << '\n'
              << "claimed_vaults:   " << stats.claimed_vaults << '\n'
              << "heartbeat_vaults: " << stats.heartbeat_vaults << '\n';
  }

  if (vm.contains("vault")) {
    auto vault_id = vm["vault"].as<vault_id_t>();
    if (auto vault = ledger.vault_details(vault_id)) {
      print_vault(*vault, ledger);
      if (auto remaining = ledger.time_until_unlock(vault_id)) {
        std::cout << "  unlocks_in:  " << *remaining << " ms\n";
      }
    } else {
      spdlog::warn("Vault {} not found", vault_id);
    }
  }

  if (vm.contains("owner")) {
    auto owner = parse_account(vm["owner"].as<std::string>());
    print_ids("owner vaults", ledger.owner_vaults(owner));
  }

  if (vm.contains("beneficiary")) {
    auto beneficiary = parse_account(vm["beneficiary"].as<std::string>());
    print_ids("beneficiary vaults", ledger.beneficiary_vaults(beneficiary));
  }

  if (vm.contains("token")) {
    auto token_id = vm["token"].as<token_id_t>();
    if (auto token = ledger.token_details(token_id)) {
      std::cout << "token " << token->token_id << '\n'
                << "  vault:       " << token->vault_id << '\n'
                << "  beneficiary: " << to_hex(bytes_view_t{token->beneficiary})
                << '\n'
                << "  active:      " << std::boolalpha << token->active << '\n'
                << "  minted_at:   " << token->minted_at << '\n';
    } else {
      spdlog::warn("Token {} not found", token_id);
    }
  }

  if (vm.contains("overdue")) {
    auto vault_id = vm["overdue"].as<vault_id_t>();
    std::cout << "vault " << vault_id << " overdue: " << std::boolalpha
              << ledger.is_heartbeat_overdue(vault_id);
    if (auto deadline = ledger.heartbeat_deadline(vault_id)) {
      std::cout << " (deadline " << *deadline << ')';
    }
    std::cout << '\n';
  }

  if (vm.contains("events")) {
    auto [from_id, to_id] = parse_event_range(vm["events"].as<std::string>());
    for (const auto& event : ledger.events(from_id, to_id)) {
      print_event(event);
    }
  }

  spdlog::shutdown();
  return 0;
}
