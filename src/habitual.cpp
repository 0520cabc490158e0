#include "habitual.hpp"

#include "streak.hpp"

// ─────────────────────────────────────
int StatusForError(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation:
        return 422;
    case ErrorKind::NotFound:
        return 404;
    case ErrorKind::Conflict:
        return 400;
    case ErrorKind::Storage:
        return 500;
    }
    return 500;
}

// ─────────────────────────────────────
Habitual::Habitual(const Config &config, HabitStore &store) : m_Config(config), m_Store(store) {
    InitServer();
}

// ─────────────────────────────────────
Habitual::~Habitual() {
    Stop();
    Wait();
}

// ─────────────────────────────────────
bool Habitual::Start() {
    if (m_Config.port == 0) {
        m_BoundPort = m_Server.bind_to_any_port(m_Config.host);
    } else {
        const int port = static_cast<int>(m_Config.port);
        m_BoundPort = m_Server.bind_to_port(m_Config.host, port) ? port : -1;
    }

    if (m_BoundPort < 0) {
        spdlog::error("Unable to bind {}:{}", m_Config.host, m_Config.port);
        return false;
    }

    spdlog::info("Serving on: http://{}:{}", m_Config.host, m_BoundPort);
    m_Thread = std::thread([this] {
        if (!m_Server.listen_after_bind()) {
            spdlog::error("Server stopped listening unexpectedly");
        }
    });
    m_Server.wait_until_ready();
    return true;
}

// ─────────────────────────────────────
void Habitual::Stop() {
    if (m_Server.is_running()) {
        spdlog::info("Stopping server");
        m_Server.stop();
    }
}

// ─────────────────────────────────────
void Habitual::Wait() {
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
void Habitual::SendJson(httplib::Response &res, int status, const nlohmann::json &body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// ─────────────────────────────────────
void Habitual::HandleRequest(const char *route, httplib::Response &res,
                             const std::function<void()> &handler) {
    try {
        handler();
    } catch (const StoreError &e) {
        const int status = StatusForError(e.Kind());
        if (e.Kind() == ErrorKind::Storage) {
            spdlog::error("[SERVER] {} failed: {}", route, e.what());
            SendJson(res, status, ErrorToJson("Internal server error"));
            return;
        }
        spdlog::warn("[SERVER] {} rejected ({}): {}", route, ErrorKindName(e.Kind()), e.what());
        SendJson(res, status, ErrorToJson(e.what()));
    } catch (const std::exception &e) {
        spdlog::error("[SERVER] {} failed: {}", route, e.what());
        SendJson(res, 500, ErrorToJson("Internal server error"));
    }
}

// ─────────────────────────────────────
nlohmann::json Habitual::HabitWithStreak(const Habit &habit) {
    return HabitToJson(habit, CurrentStreak(m_Store.CompletionDates(habit.id), Today()));
}

// ─────────────────────────────────────
void Habitual::InitServer() {
    m_Server.set_payload_max_length(64 * 1024); // 64 KB
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    const unsigned threads = m_Config.threads;
    m_Server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    // Browser front ends are served from another origin.
    m_Server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
    });

    m_Server.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        spdlog::debug("[SERVER] {} {} -> {}", req.method, req.path, res.status);
    });

    m_Server.set_error_handler([this](const httplib::Request &, httplib::Response &res) {
        if (res.body.empty()) {
            SendJson(res, res.status, ErrorToJson(res.status == 404 ? "Not Found" : "Error"));
        }
    });

    // CORS preflight
    {
        m_Server.Options(R"(/api/.*)", [](const httplib::Request &, httplib::Response &res) {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.set_header("Access-Control-Max-Age", "86400");
            res.status = 204;
        });
    }

    // Health / Version
    {
        m_Server.Get("/api/health", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, 200, {{"status", "healthy"}});
        });

        m_Server.Get("/api/version", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, 200, {{"version", HABITUAL_VERSION}});
        });
    }

    // Habits
    {
        m_Server.Get("/api/habits", [this](const httplib::Request &, httplib::Response &res) {
            HandleRequest("GET /api/habits", res, [&] {
                const auto habits = m_Store.ListHabits();
                const auto datesByHabit = m_Store.CompletionDatesByHabit();
                const Date today = Today();

                nlohmann::json rows = nlohmann::json::array();
                for (const auto &habit : habits) {
                    auto it = datesByHabit.find(habit.id);
                    const int streak =
                        it == datesByHabit.end() ? 0 : CurrentStreak(it->second, today);
                    rows.push_back(HabitToJson(habit, streak));
                }
                SendJson(res, 200, rows);
            });
        });

        m_Server.Post("/api/habits", [this](const httplib::Request &req, httplib::Response &res) {
            HandleRequest("POST /api/habits", res, [&] {
                const auto body = m_JsonParse.ParseObject(req.body);
                const std::string name = m_JsonParse.GetString(body, "name");
                const auto emoji = m_JsonParse.GetOptionalString(body, "emoji");

                const Habit habit = m_Store.CreateHabit(name, emoji.value_or(kDefaultEmoji));
                spdlog::info("Habit {} created: '{}'", habit.id, habit.name);
                SendJson(res, 200, HabitToJson(habit, 0));
            });
        });

        m_Server.Put(R"(/api/habits/([^/]+))",
                     [this](const httplib::Request &req, httplib::Response &res) {
                         HandleRequest("PUT /api/habits/{id}", res, [&] {
                             const std::int64_t id = ParseId(req.matches[1]);
                             const auto body = m_JsonParse.ParseObject(req.body);
                             const std::string name = m_JsonParse.GetString(body, "name");
                             const std::string emoji = m_JsonParse.GetString(body, "emoji");

                             const Habit habit = m_Store.UpdateHabit(id, name, emoji);
                             spdlog::info("Habit {} updated", habit.id);
                             SendJson(res, 200, HabitWithStreak(habit));
                         });
                     });

        m_Server.Delete(R"(/api/habits/([^/]+))",
                        [this](const httplib::Request &req, httplib::Response &res) {
                            HandleRequest("DELETE /api/habits/{id}", res, [&] {
                                const std::int64_t id = ParseId(req.matches[1]);
                                m_Store.DeleteHabit(id);
                                spdlog::info("Habit {} deleted", id);
                                SendJson(res, 200, {{"message", "Habit deleted successfully"}});
                            });
                        });
    }

    // Completions
    {
        m_Server.Get("/api/completions", [this](const httplib::Request &, httplib::Response &res) {
            HandleRequest("GET /api/completions", res, [&] {
                nlohmann::json rows = nlohmann::json::array();
                for (const auto &completion : m_Store.ListCompletions()) {
                    rows.push_back(CompletionToJson(completion));
                }
                SendJson(res, 200, rows);
            });
        });

        m_Server.Post("/api/completions",
                      [this](const httplib::Request &req, httplib::Response &res) {
                          HandleRequest("POST /api/completions", res, [&] {
                              const auto body = m_JsonParse.ParseObject(req.body);
                              const std::int64_t habitId = m_JsonParse.GetInt(body, "habit_id");
                              const Date day = m_JsonParse.GetDate(body, "completed_date");

                              const Completion completion = m_Store.CreateCompletion(habitId, day);
                              spdlog::info("Habit {} completed on {}", habitId, FormatDate(day));
                              SendJson(res, 200, CompletionToJson(completion));
                          });
                      });

        m_Server.Delete(R"(/api/completions/([^/]+))",
                        [this](const httplib::Request &req, httplib::Response &res) {
                            HandleRequest("DELETE /api/completions/{id}", res, [&] {
                                const std::int64_t id = ParseId(req.matches[1]);
                                m_Store.DeleteCompletion(id);
                                spdlog::info("Completion {} deleted", id);
                                SendJson(res, 200,
                                         {{"message", "Completion deleted successfully"}});
                            });
                        });
    }
}
