#pragma once

#include <functional>
#include <string>
#include <thread>

// Libs
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// parts
#include "config.hpp"
#include "habitstore.hpp"
#include "json.hpp"

#ifndef HABITUAL_VERSION
#define HABITUAL_VERSION "0.0.0"
#endif

// HTTP status for a StoreError kind.
int StatusForError(ErrorKind kind);

class Habitual {
  public:
    Habitual(const Config &config, HabitStore &store);
    ~Habitual();

    Habitual(const Habitual &) = delete;
    Habitual &operator=(const Habitual &) = delete;

    // Binds and serves on a background thread. With port 0 an ephemeral port
    // is chosen; see Port().
    bool Start();
    void Stop();
    void Wait();
    int Port() const {
        return m_BoundPort;
    }

  private:
    void InitServer();
    nlohmann::json HabitWithStreak(const Habit &habit);
    void HandleRequest(const char *route, httplib::Response &res,
                       const std::function<void()> &handler);
    void SendJson(httplib::Response &res, int status, const nlohmann::json &body);

  private:
    Config m_Config;
    HabitStore &m_Store;
    JsonParse m_JsonParse;

    // Server
    httplib::Server m_Server;
    std::thread m_Thread;
    int m_BoundPort = -1;
};
