#include "holdem_service.hpp"
#include "holdem/engine.hpp"
#include "holdem/hand_evaluator.hpp"
#include "holdem/logging.hpp"
#include "holdem/snapshot.hpp"
#include <nlohmann/json.hpp>

namespace holdem {
namespace service {

namespace {

constexpr const char* kDomain = "holdem";
constexpr int kMaxEvaluatedCards = 7;

nlohmann::json winners_json(const HandOutcome& outcome) {
    nlohmann::json winners = nlohmann::json::array();
    for (const auto& winner : outcome.winners) {
        winners.push_back({{"player_id", winner.player_id},
                           {"amount", winner.amount},
                           {"hand", winner.hand}});
    }
    return winners;
}

void log_hand_finished(const Table& table, const HandOutcome& outcome) {
    log_info(kDomain, "hand_finished",
             {{"table_id", table.config.table_id},
              {"hand_number", table.hand_number},
              {"uncontested", outcome.uncontested},
              {"awarded", outcome.total_awarded()},
              {"winners", winners_json(outcome)}});
}

/// Player-facing view: everything except the undealt deck.
v1::TableSnapshot view(const Table& table) {
    return snapshot::to_proto(table, false);
}

} // anonymous namespace

HoldemTableService::HoldemTableService(const ServerConfig& config)
    : registry_(config.max_tables, config.shuffle_seed) {}

grpc::Status HoldemTableService::rejected(const std::string& command, const std::string& table_id,
                                          const Rejection& rejection) const {
    log_warn(kDomain, "command_rejected",
             {{"command", command},
              {"table_id", table_id},
              {"kind", to_string(rejection.kind)},
              {"reason", rejection.message}});
    return grpc::Status(rejection.status_code, rejection.message);
}

grpc::Status HoldemTableService::CreateTable(grpc::ServerContext* /*context*/,
                                             const v1::CreateTableRequest* request,
                                             v1::TableResponse* response) {
    try {
        Table table = create_table(snapshot::from_proto(request->settings()));
        std::string table_id = registry_.create(std::move(table));
        registry_.with_table(table_id, [&](Table& t, RandomSource&) {
            *response->mutable_table() = view(t);
            log_info(kDomain, "table_created",
                     {{"table_id", table_id},
                      {"host_id", t.config.host_id},
                      {"mode", to_string(t.config.mode)},
                      {"max_players", t.config.max_players},
                      {"small_blind", t.config.small_blind},
                      {"big_blind", t.config.big_blind}});
        });
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("create_table", request->settings().table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::CloseTable(grpc::ServerContext* /*context*/,
                                            const v1::TableRequest* request,
                                            v1::CloseTableResponse* response) {
    bool closed = registry_.close(request->table_id());
    response->set_closed(closed);
    if (closed) {
        log_info(kDomain, "table_closed", {{"table_id", request->table_id()}});
    }
    return grpc::Status::OK;
}

grpc::Status HoldemTableService::JoinTable(grpc::ServerContext* /*context*/,
                                           const v1::JoinTableRequest* request,
                                           v1::JoinTableResponse* response) {
    try {
        auto result = registry_.with_table(request->table_id(), [&](Table& table, RandomSource&) {
            auto r = add_player(table, request->player_id(), request->display_name());
            if (r.ok()) {
                *response->mutable_table() = view(table);
                *response->mutable_seat() = snapshot::to_proto(*r.seat);
            }
            return r;
        });
        if (!result.ok()) {
            return rejected("join_table", request->table_id(), *result.error);
        }
        log_info(kDomain, "player_joined",
                 {{"table_id", request->table_id()},
                  {"player_id", request->player_id()},
                  {"chips", response->seat().chips()}});
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("join_table", request->table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::LeaveTable(grpc::ServerContext* /*context*/,
                                            const v1::LeaveTableRequest* request,
                                            v1::TableResponse* response) {
    try {
        auto result = registry_.with_table(request->table_id(), [&](Table& table, RandomSource&) {
            auto r = remove_player(table, request->player_id());
            if (r.ok()) {
                *response->mutable_table() = view(table);
                if (r.result) {
                    *response->mutable_result() = snapshot::to_proto(*r.result);
                    log_hand_finished(table, *r.result);
                }
            }
            return r;
        });
        if (!result.ok()) {
            return rejected("leave_table", request->table_id(), *result.error);
        }
        log_info(kDomain, "player_left",
                 {{"table_id", request->table_id()},
                  {"player_id", request->player_id()},
                  {"phase", to_string(result.phase)}});
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("leave_table", request->table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::StartHand(grpc::ServerContext* /*context*/,
                                           const v1::TableRequest* request,
                                           v1::TableResponse* response) {
    try {
        auto result = registry_.with_table(request->table_id(), [&](Table& table, RandomSource& rng) {
            auto r = start_hand(table, rng);
            if (r.ok()) {
                *response->mutable_table() = view(table);
                log_info(kDomain, "hand_started",
                         {{"table_id", request->table_id()},
                          {"hand_number", table.hand_number},
                          {"players", table.seat_count()},
                          {"dealer_index", table.dealer_index}});
                if (r.result) {
                    *response->mutable_result() = snapshot::to_proto(*r.result);
                    log_hand_finished(table, *r.result);
                }
            }
            return r;
        });
        if (!result.ok()) {
            return rejected("start_hand", request->table_id(), *result.error);
        }
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("start_hand", request->table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::Act(grpc::ServerContext* /*context*/,
                                     const v1::ActRequest* request,
                                     v1::TableResponse* response) {
    try {
        ActionType action = snapshot::from_proto(request->action());
        auto result = registry_.with_table(request->table_id(), [&](Table& table, RandomSource&) {
            auto r = player_action(table, request->player_id(), action, request->amount());
            if (r.ok()) {
                *response->mutable_table() = view(table);
                int seat = table.find_seat(request->player_id());
                log_info(kDomain, "action_applied",
                         {{"table_id", request->table_id()},
                          {"player_id", request->player_id()},
                          {"action", to_string(action)},
                          {"label", seat >= 0 ? table.seats[static_cast<size_t>(seat)].last_action : ""},
                          {"pot", table.pot},
                          {"phase", to_string(table.phase)}});
                if (r.result) {
                    *response->mutable_result() = snapshot::to_proto(*r.result);
                    log_hand_finished(table, *r.result);
                }
            }
            return r;
        });
        if (!result.ok()) {
            return rejected("act", request->table_id(), *result.error);
        }
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("act", request->table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::GetTable(grpc::ServerContext* /*context*/,
                                          const v1::TableRequest* request,
                                          v1::TableResponse* response) {
    try {
        registry_.with_table(request->table_id(), [&](Table& table, RandomSource&) {
            *response->mutable_table() = view(table);
        });
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("get_table", request->table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::GetValidActions(grpc::ServerContext* /*context*/,
                                                 const v1::TableRequest* request,
                                                 v1::ValidActionsResponse* response) {
    try {
        registry_.with_table(request->table_id(), [&](Table& table, RandomSource&) {
            const Seat* seat = table.current_seat();
            if (seat == nullptr) {
                return;
            }
            response->set_player_id(seat->player_id);
            for (auto action : get_valid_actions(table)) {
                response->add_actions(snapshot::to_proto(action));
            }
            response->set_amount_to_call(amount_to_call(table));
            response->set_min_raise_to(min_raise_to(table));
        });
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("get_valid_actions", request->table_id(), Rejection::from(e));
    }
}

grpc::Status HoldemTableService::EvaluateHand(grpc::ServerContext* /*context*/,
                                              const v1::EvaluateHandRequest* request,
                                              v1::HandResultSnapshot* response) {
    try {
        if (request->cards_size() > kMaxEvaluatedCards) {
            throw CommandRejectedError::invalid_argument("At most 7 cards can be evaluated.");
        }
        std::vector<Card> cards;
        for (const auto& text : request->cards()) {
            auto card = parse_card(text);
            if (!card) {
                throw CommandRejectedError::invalid_argument("Invalid card: " + text);
            }
            for (const auto& seen : cards) {
                if (seen == *card) {
                    throw CommandRejectedError::invalid_argument("Duplicate card: " + text);
                }
            }
            cards.push_back(*card);
        }
        *response = snapshot::to_proto(evaluate_hand(cards));
        return grpc::Status::OK;
    } catch (const CommandRejectedError& e) {
        return rejected("evaluate_hand", "", Rejection::from(e));
    }
}

std::unique_ptr<HoldemTableService> create_holdem_service(const ServerConfig& config) {
    return std::make_unique<HoldemTableService>(config);
}

} // namespace service
} // namespace holdem
