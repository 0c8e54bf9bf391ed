// Stands in for the container runtime binary in tests. Every `run` flag is
// accepted and ignored; behaviour is picked through environment variables and
// the tool being called.
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

std::mutex g_out_mu;

static bool EnvFlag(const char* name) {
  const char* v = std::getenv(name);
  return v && std::strcmp(v, "1") == 0;
}

static void WriteLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(g_out_mu);
  std::cout << line << "\n" << std::flush;
}

static void Reply(const nlohmann::json& id, const nlohmann::json& result) {
  WriteLine(nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump());
}

static void ReplyError(const nlohmann::json& id, int code, const std::string& message) {
  WriteLine(nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}}.dump());
}

static nlohmann::json TextContent(const std::string& text) {
  return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}

static nlohmann::json AllTools() {
  return nlohmann::json::parse(R"([
    {"name": "write_file",
     "description": "Write a file.\nArgs:\n  path: where to write\n  content: what to write",
     "inputSchema": {"type": "object",
                     "properties": {"path": {"type": "string"},
                                    "content": {"type": "string"},
                                    "mode": {"type": ["null", "integer"], "description": "file mode"}},
                     "required": ["path", "content"]},
     "annotations": {"title": "Write File", "destructiveHint": true}},
    {"name": "read_file",
     "description": "Read a file.\n\nArgs:\n  path: the file to read",
     "inputSchema": {"type": "object",
                     "properties": {"path": {"type": "string"},
                                    "lines": {"type": "array", "items": {"type": "integer"}}},
                     "required": ["path"]}},
    {"name": "echo", "description": "Echo text back."}
  ])");
}

static nlohmann::json AllPrompts() {
  return nlohmann::json::parse(R"([
    {"name": "summarize", "description": "Summarize a document",
     "arguments": [{"name": "style"}, {"name": "document", "description": "text to summarize", "required": true}]},
    {"name": "greet"}
  ])");
}

struct ServerState {
  bool initialized = false;
  int initialize_requests = 0;
  std::vector<nlohmann::json> held;
};

static void CallTool(const nlohmann::json& id, const nlohmann::json& params, int argc, char** argv, ServerState* state) {
  const std::string name = params.value("name", "");
  const nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();

  if (name == "echo") {
    const int delay_ms = args.value("delay_ms", 0);
    const std::string text = args.value("text", "");
    std::thread([id, delay_ms, text]() {
      if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
      Reply(id, TextContent(text));
    }).detach();
  } else if (name == "argv") {
    nlohmann::json out = nlohmann::json::array();
    for (int i = 1; i < argc; i++) out.push_back(argv[i]);
    Reply(id, {{"argv", out}, {"arguments", args}});
  } else if (name == "env") {
    const std::string var = args.value("name", "");
    const char* v = std::getenv(var.c_str());
    Reply(id, {{"value", v ? nlohmann::json(v) : nlohmann::json()}});
  } else if (name == "state") {
    Reply(id, {{"initialized", state->initialized}, {"initialize_requests", state->initialize_requests}});
  } else if (name == "latin1") {
    // A raw ISO-8859-1 byte, which is not valid UTF-8.
    WriteLine("{\"jsonrpc\":\"2.0\",\"id\":" + id.dump() + ",\"result\":{\"text\":\"caf\xe9\"}}");
  } else if (name == "hold") {
    state->held.push_back(id);
  } else if (name == "release_held") {
    for (const auto& held : state->held) {
      Reply(held, TextContent("held"));
      WriteLine("garbage between frames {{{");
    }
    state->held.clear();
    Reply(id, TextContent("released"));
  } else if (name == "sleep") {
    // Blocks the read loop, so stdin is not drained meanwhile.
    std::this_thread::sleep_for(std::chrono::milliseconds(args.value("ms", 0)));
    Reply(id, TextContent("slept"));
  } else if (name == "ping_flood") {
    std::this_thread::sleep_for(std::chrono::milliseconds(args.value("delay_ms", 0)));
    WriteLine("{\"jsonrpc\":\"2.0\",\"id\":99,\"method\":\"ping\"}");
    const std::string note = "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"data\":\"" +
                             std::string(1000, 'x') + "\"}}";
    for (int i = 0; i < args.value("notes", 0); i++) WriteLine(note);
    Reply(id, TextContent("flooded"));
  } else if (name == "fail") {
    ReplyError(id, -32000, "tool failed");
  } else if (name == "crash") {
    std::cerr << "crashing on purpose\n" << std::flush;
    std::_Exit(3);
  } else if (name == "hang") {
    // Never answered.
  } else if (name == "noisy") {
    WriteLine("this is not json-rpc");
    WriteLine("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\",\"params\":{\"progress\":1}}");
    Reply(id, TextContent("after noise"));
  } else if (name == "ping_first") {
    // Same numeric id space as the client's own requests.
    WriteLine("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}");
    WriteLine("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"sampling/createMessage\",\"params\":{}}");
    Reply(id, TextContent("pinged"));
  } else {
    ReplyError(id, -32602, "unknown tool: " + name);
  }
}

static nlohmann::json Page(const nlohmann::json& all, const nlohmann::json& params, const char* key) {
  if (!EnvFlag("FAKE_PAGED")) return {{key, all}};
  const bool second = params.is_object() && params.value("cursor", "") == "page-2";
  nlohmann::json items = nlohmann::json::array();
  for (size_t i = 0; i < all.size(); i++) {
    if ((i == 0) != second) items.push_back(all[i]);
  }
  nlohmann::json out = {{key, items}};
  if (!second) out["nextCursor"] = "page-2";
  return out;
}

static int RunSidecar() {
  std::cout << "Starting..." << std::endl;
  if (EnvFlag("FAKE_SIDECAR_EXIT")) {
    std::cout << "sidecar failed to bind" << std::endl;
    return 2;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  if (!EnvFlag("FAKE_SIDECAR_NEVER_READY")) std::cout << "Remote interface available.\nStarted." << std::endl;
  while (true) std::this_thread::sleep_for(std::chrono::seconds(1));
}

}  // namespace

int main(int argc, char** argv) {
  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--name") == 0) return RunSidecar();
  }

  std::cerr << "fake server booting" << std::endl;
  if (EnvFlag("FAKE_FAIL_INIT")) {
    std::cerr << "fatal: API_TOKEN is not set" << std::endl;
    return 1;
  }

  ServerState state;
  std::string line;
  while (std::getline(std::cin, line)) {
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object() || !msg.contains("method")) continue;
    const std::string method = msg["method"].get<std::string>();
    const nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();
    if (!msg.contains("id")) {
      if (method == "notifications/initialized") state.initialized = true;
      continue;
    }
    const nlohmann::json id = msg["id"];

    if (method == "initialize") {
      state.initialize_requests++;
      if (EnvFlag("FAKE_SILENT_INIT")) continue;
      WriteLine("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"level\":\"info\"}}");
      Reply(id, {{"protocolVersion", params.value("protocolVersion", "")},
                 {"capabilities", {{"tools", nlohmann::json::object()}}},
                 {"serverInfo", {{"name", "fake"}, {"version", "0.1"}}},
                 {"instructions", params.contains("clientInfo") ? params["clientInfo"].value("name", "") : ""}});
    } else if (method == "tools/list") {
      Reply(id, Page(AllTools(), params, "tools"));
    } else if (method == "prompts/list") {
      Reply(id, Page(AllPrompts(), params, "prompts"));
    } else if (method == "tools/call") {
      CallTool(id, params, argc, argv, &state);
    } else {
      ReplyError(id, -32601, "method not found");
    }
  }
  std::cout << std::flush;
  std::_Exit(0);
}
