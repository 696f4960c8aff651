#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/scavenger_ledger.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "scavenger/ledger/v1.hpp"

using namespace scavenger::ledger::v1;

namespace {

constexpr int kExitOk                 = 0;
constexpr int kExitUsage              = 1;
constexpr int kExitInternal           = 2;
constexpr int kExitNotFound           = 3;
constexpr int kExitUnauthorized       = 4;
constexpr int kExitInvalidInput       = 5;
constexpr int kExitInvalidState       = 6;
constexpr int kExitInsufficientBudget = 7;
constexpr int kExitOverflow           = 8;

void Usage() {
  std::cerr << "Usage: scavengerctl --config <config.yaml> <command> [args...]\n"
            << "Waste:\n"
            << "  submit <category> <weight_grams> <submitter> [latitude] [longitude] [description]\n"
            << "  submit-batch <submitter> <category:weight_grams>...\n"
            << "  transfer <waste_id> <from> <to> [note]\n"
            << "  transfer-bulk <category> <collector> <manufacturer> [note]\n"
            << "  finalize-weight <waste_id> <caller> <weight_grams>\n"
            << "  confirm <waste_id> <confirmer>\n"
            << "  reset-confirmation <waste_id> <caller>\n"
            << "  deactivate <waste_id> <admin>\n"
            << "  update-status <waste_id> <pending|processing|processed|rejected>\n"
            << "  get-waste <waste_id>\n"
            << "  get-wastes <waste_id>...\n"
            << "  waste-exists <waste_id>\n"
            << "  history <waste_id>\n"
            << "  participant-wastes <participant>\n"
            << "  can-transfer <from> <to>\n"
            << "Incentives:\n"
            << "  create-incentive <issuer> <category> <reward_rate> <total_budget>\n"
            << "  update-incentive <incentive_id> <caller> <reward_rate> <total_budget>\n"
            << "  set-incentive-active <incentive_id> <caller> <true|false>\n"
            << "  get-incentive <incentive_id>\n"
            << "  incentive-exists <incentive_id>\n"
            << "  incentives-by-issuer <issuer>\n"
            << "  incentives-by-category <category>\n"
            << "  best-incentive <issuer> <category>\n"
            << "  active-incentives <category>\n"
            << "Settlement:\n"
            << "  settle <waste_id> <incentive_id> <caller>\n"
            << "  earnings <participant>\n"
            << "  stats\n"
            << "  participant-stats <participant>\n"
            << "Categories: paper, pet_plastic, plastic, metal, glass\n";
}

std::string Upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

uint64_t ParseU64(const std::string& value, const std::string& name) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw scavenger::util::InvalidInput(name + " must be an unsigned integer, got '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw scavenger::util::InvalidInput(name + " is out of range: " + value);
  }
}

int64_t ParseI64(const std::string& value, const std::string& name) {
  size_t  consumed = 0;
  int64_t parsed   = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw scavenger::util::InvalidInput(name + " must be an integer, got '" + value + "'");
  }
  if (consumed == value.size()) return parsed;
  throw scavenger::util::InvalidInput(name + " must be an integer, got '" + value + "'");
}

bool ParseBool(const std::string& value, const std::string& name) {
  if (value == "true") return true;
  if (value == "false") return false;
  throw scavenger::util::InvalidInput(name + " must be true or false, got '" + value + "'");
}

WasteCategory ParseCategory(const std::string& value) {
  WasteCategory category = WASTE_CATEGORY_UNSPECIFIED;
  if (!WasteCategory_Parse("WASTE_CATEGORY_" + Upper(value), &category) || category == WASTE_CATEGORY_UNSPECIFIED) {
    throw scavenger::util::InvalidInput("unknown waste category '" + value + "'");
  }
  return category;
}

WasteStatus ParseStatus(const std::string& value) {
  WasteStatus status = WASTE_STATUS_UNSPECIFIED;
  if (!WasteStatus_Parse("WASTE_STATUS_" + Upper(value), &status) || status == WASTE_STATUS_UNSPECIFIED) {
    throw scavenger::util::InvalidInput("unknown waste status '" + value + "'");
  }
  return status;
}

// "plastic:5000" -> one batch item.
WasteSubmission ParseSubmission(const std::string& value) {
  const auto separator = value.find(':');
  if (separator == std::string::npos) {
    throw scavenger::util::InvalidInput("batch item must be <category>:<weight_grams>, got '" + value + "'");
  }
  WasteSubmission item;
  item.set_category(ParseCategory(value.substr(0, separator)));
  item.set_weight_grams(ParseU64(value.substr(separator + 1), "weight_grams"));
  return item;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render JSON: " + std::string(status.message()));
  }
  return json;
}

void PrintMessage(const google::protobuf::Message& message) {
  std::cout << ToJson(message) << "\n";
}

template <typename Message>
void PrintOptional(const std::optional<Message>& message) {
  if (message.has_value()) {
    PrintMessage(*message);
  } else {
    std::cout << "null\n";
  }
}

void PrintBool(const std::string& key, bool value) {
  google::protobuf::Struct result;
  (*result.mutable_fields())[key].set_bool_value(value);
  PrintMessage(result);
}

void PrintIds(const std::vector<uint64_t>& ids) {
  IdList list;
  for (const auto id : ids) list.add_ids(id);
  PrintMessage(list);
}

void PrintError(const std::string& kind, const std::string& message) {
  google::protobuf::Struct error;
  (*error.mutable_fields())["error"].set_string_value(kind);
  (*error.mutable_fields())["message"].set_string_value(message);
  std::cout << ToJson(error) << "\n";
}

struct Command {
  size_t                                                                               min_args;
  std::function<void(scavenger::core::ScavengerLedger&, const std::vector<std::string>&)> run;
};

std::string ArgOr(const std::vector<std::string>& args, size_t index, const std::string& fallback) {
  return index < args.size() ? args[index] : fallback;
}

std::map<std::string, Command> Commands() {
  using scavenger::core::ScavengerLedger;
  using Args = std::vector<std::string>;

  std::map<std::string, Command> commands;

  commands["submit"] = {3, [](ScavengerLedger& ledger, const Args& a) {
                          Location location;
                          location.set_latitude(ParseI64(ArgOr(a, 3, "0"), "latitude"));
                          location.set_longitude(ParseI64(ArgOr(a, 4, "0"), "longitude"));
                          location.set_description(ArgOr(a, 5, ""));
                          PrintMessage(ledger.SubmitWaste(ParseCategory(a[0]), ParseU64(a[1], "weight_grams"), a[2], location));
                        }};
  commands["submit-batch"] = {2, [](ScavengerLedger& ledger, const Args& a) {
                                std::vector<WasteSubmission> items;
                                for (size_t i = 1; i < a.size(); ++i) items.push_back(ParseSubmission(a[i]));
                                WasteUnitList list;
                                for (auto& unit : ledger.SubmitWasteBatch(items, a[0])) {
                                  *list.add_wastes() = std::move(unit);
                                }
                                PrintMessage(list);
                              }};
  commands["transfer"] = {3, [](ScavengerLedger& ledger, const Args& a) {
                            PrintMessage(ledger.TransferWaste(ParseU64(a[0], "waste_id"), a[1], a[2], ArgOr(a, 3, "")));
                          }};
  commands["transfer-bulk"] = {3, [](ScavengerLedger& ledger, const Args& a) {
                                 PrintMessage(ledger.TransferBulkWaste(ParseCategory(a[0]), a[1], a[2], Location(), ArgOr(a, 3, "")));
                               }};
  commands["finalize-weight"] = {3, [](ScavengerLedger& ledger, const Args& a) {
                                   PrintMessage(ledger.FinalizeWasteWeight(ParseU64(a[0], "waste_id"), a[1], ParseU64(a[2], "weight_grams")));
                                 }};
  commands["confirm"] = {2, [](ScavengerLedger& ledger, const Args& a) {
                           PrintMessage(ledger.ConfirmWaste(ParseU64(a[0], "waste_id"), a[1]));
                         }};
  commands["reset-confirmation"] = {2, [](ScavengerLedger& ledger, const Args& a) {
                                      PrintMessage(ledger.ResetWasteConfirmation(ParseU64(a[0], "waste_id"), a[1]));
                                    }};
  commands["deactivate"] = {2, [](ScavengerLedger& ledger, const Args& a) {
                              PrintMessage(ledger.DeactivateWaste(ParseU64(a[0], "waste_id"), a[1]));
                            }};
  commands["update-status"] = {2, [](ScavengerLedger& ledger, const Args& a) {
                                 PrintBool("updated", ledger.UpdateWasteStatus(ParseU64(a[0], "waste_id"), ParseStatus(a[1])));
                               }};
  commands["get-waste"] = {1, [](ScavengerLedger& ledger, const Args& a) { PrintOptional(ledger.GetWaste(ParseU64(a[0], "waste_id"))); }};
  commands["get-wastes"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                              std::vector<uint64_t> ids;
                              for (const auto& arg : a) ids.push_back(ParseU64(arg, "waste_id"));
                              const auto      units = ledger.GetWastesBatch(ids);
                              WasteLookupList list;
                              for (size_t i = 0; i < ids.size(); ++i) {
                                auto* entry = list.add_entries();
                                entry->set_id(ids[i]);
                                entry->set_found(units[i].has_value());
                                if (units[i].has_value()) *entry->mutable_waste() = *units[i];
                              }
                              PrintMessage(list);
                            }};
  commands["waste-exists"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                                PrintBool("exists", ledger.WasteExists(ParseU64(a[0], "waste_id")));
                              }};
  commands["history"]   = {1, [](ScavengerLedger& ledger, const Args& a) {
                           TransferHistory history;
                           for (const auto& record : ledger.GetWasteTransferHistory(ParseU64(a[0], "waste_id"))) {
                             *history.add_transfers() = record;
                           }
                           PrintMessage(history);
                         }};
  commands["participant-wastes"] = {1, [](ScavengerLedger& ledger, const Args& a) { PrintIds(ledger.GetParticipantWastes(a[0])); }};
  commands["can-transfer"] = {2, [](ScavengerLedger& ledger, const Args& a) { PrintBool("allowed", ledger.CanTransfer(a[0], a[1])); }};

  commands["create-incentive"] = {4, [](ScavengerLedger& ledger, const Args& a) {
                                    PrintMessage(ledger.CreateIncentive(a[0], ParseCategory(a[1]), ParseU64(a[2], "reward_rate"),
                                                                        ParseU64(a[3], "total_budget")));
                                  }};
  commands["update-incentive"] = {4, [](ScavengerLedger& ledger, const Args& a) {
                                    PrintMessage(ledger.UpdateIncentive(ParseU64(a[0], "incentive_id"), a[1], ParseU64(a[2], "reward_rate"),
                                                                        ParseU64(a[3], "total_budget")));
                                  }};
  commands["set-incentive-active"] = {3, [](ScavengerLedger& ledger, const Args& a) {
                                        PrintMessage(ledger.SetIncentiveActive(ParseU64(a[0], "incentive_id"), a[1], ParseBool(a[2], "active")));
                                      }};
  commands["get-incentive"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                                 PrintOptional(ledger.GetIncentiveById(ParseU64(a[0], "incentive_id")));
                               }};
  commands["incentive-exists"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                                    PrintBool("exists", ledger.IncentiveExists(ParseU64(a[0], "incentive_id")));
                                  }};
  commands["incentives-by-issuer"] = {1, [](ScavengerLedger& ledger, const Args& a) { PrintIds(ledger.GetIncentivesByIssuer(a[0])); }};
  commands["incentives-by-category"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                                          PrintIds(ledger.GetIncentivesByCategory(ParseCategory(a[0])));
                                        }};
  commands["best-incentive"] = {2, [](ScavengerLedger& ledger, const Args& a) {
                                  PrintOptional(ledger.GetBestActiveIncentiveFor(a[0], ParseCategory(a[1])));
                                }};
  commands["active-incentives"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                                     IncentiveList list;
                                     for (const auto& program : ledger.GetActiveIncentivesSorted(ParseCategory(a[0]))) {
                                       *list.add_incentives() = program;
                                     }
                                     PrintMessage(list);
                                   }};

  commands["settle"] = {3, [](ScavengerLedger& ledger, const Args& a) {
                          PrintMessage(ledger.SettleRewards(ParseU64(a[0], "waste_id"), ParseU64(a[1], "incentive_id"), a[2]));
                        }};
  commands["earnings"] = {1, [](ScavengerLedger& ledger, const Args& a) {
                            ParticipantEarnings earnings;
                            earnings.set_participant(a[0]);
                            earnings.set_total_earned(ledger.GetEarnings(a[0]));
                            PrintMessage(earnings);
                          }};
  commands["stats"] = {0, [](ScavengerLedger& ledger, const Args&) { PrintMessage(ledger.GetSupplyChainStats()); }};
  commands["participant-stats"] = {1, [](ScavengerLedger& ledger, const Args& a) { PrintOptional(ledger.GetParticipantStats(a[0])); }};

  return commands;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string config_path = argv[2];
  const std::string name        = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  const auto commands = Commands();
  const auto command  = commands.find(name);
  if (command == commands.end()) {
    std::cerr << "unknown command: " << name << "\n";
    Usage();
    return kExitUsage;
  }
  if (args.size() < command->second.min_args) {
    std::cerr << name << ": expected at least " << command->second.min_args << " arguments\n";
    Usage();
    return kExitUsage;
  }

  int exit_code = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = scavenger::config::ConfigLoader::LoadFromYaml(config_path);

    scavenger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph) and run one call
    // ------------------------------------------------------------
    auto app = scavenger::factory::Build(config);
    command->second.run(*app.ledger, args);
  } catch (const scavenger::util::NotFound& e) {
    PrintError("NotFound", e.what());
    exit_code = kExitNotFound;
  } catch (const scavenger::util::Unauthorized& e) {
    PrintError("Unauthorized", e.what());
    exit_code = kExitUnauthorized;
  } catch (const scavenger::util::InvalidInput& e) {
    PrintError("InvalidInput", e.what());
    exit_code = kExitInvalidInput;
  } catch (const scavenger::util::InvalidState& e) {
    PrintError("InvalidState", e.what());
    exit_code = kExitInvalidState;
  } catch (const scavenger::util::InsufficientBudget& e) {
    PrintError("InsufficientBudget", e.what());
    exit_code = kExitInsufficientBudget;
  } catch (const scavenger::util::Overflow& e) {
    PrintError("Overflow", e.what());
    exit_code = kExitOverflow;
  } catch (const std::exception& e) {
    SCAVENGER_LOG_ERROR("Fatal error", {scavenger::observability::StringField("error", e.what())});
    PrintError("Internal", e.what());
    exit_code = kExitInternal;
  }

  scavenger::observability::ShutdownLogging();
  return exit_code;
}
