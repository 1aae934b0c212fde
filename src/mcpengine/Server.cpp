//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: MCP protocol server implementation
//==========================================================================================================

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpengine/Server.h"
#include "mcpengine/errors/Errors.h"

namespace mcpengine {

using errors::RpcException;

namespace {

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

std::string requireString(const JSONValue& params, const std::string& key) {
    const JSONValue* v = FindMember(params, key);
    if (v == nullptr) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Missing required parameter: {}", key));
    }
    if (!v->isString()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Parameter '{}' must be a string", key));
    }
    return std::get<std::string>(v->value);
}

JSONValue objectArgument(const JSONValue& params, const std::string& key) {
    const JSONValue* v = FindMember(params, key);
    if (v == nullptr || v->isNull()) {
        return emptyObject();
    }
    if (!v->isObject()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Parameter '{}' must be an object", key));
    }
    return *v;
}

template <typename T>
JSONValue toJSONArray(const std::vector<T>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item.ToJSON()));
    }
    return JSONValue{std::move(arr)};
}

} // namespace

////////////////////////////////////////////// Session /////////////////////////////////////////////////

Session::Session(std::string peer) : peerName(std::move(peer)) {}

void Session::setClientInfo(Implementation info) {
    std::lock_guard<std::mutex> lock(mutex);
    client = std::move(info);
}

std::optional<Implementation> Session::clientInfo() const {
    std::lock_guard<std::mutex> lock(mutex);
    return client;
}

bool Session::subscribe(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex);
    return subscribed.insert(uri).second;
}

bool Session::unsubscribe(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex);
    return subscribed.erase(uri) > 0;
}

bool Session::isSubscribed(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex);
    return subscribed.count(uri) > 0;
}

std::vector<std::string> Session::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<std::string>(subscribed.begin(), subscribed.end());
}

////////////////////////////////////////////// Impl ////////////////////////////////////////////////////

class ProtocolServer::Impl {
public:
    Impl(Implementation info, const Registries& regs, std::size_t arenaBytes)
        : serverInfo(std::move(info)), registries(regs), pool(4, arenaBytes) {
        buildMethodTable();
    }

    Implementation serverInfo;
    const Registries& registries;
    MethodRegistry methods;
    ArenaPool pool;
    mutable std::mutex sessionsMutex;
    std::vector<Session*> sessions;

    void buildMethodTable();
    JSONValue capabilities() const;

    DispatchResult onInitialize(DispatchContext& ctx, const JSONValue& params);
    DispatchResult onShutdown(DispatchContext& ctx);
    DispatchResult onCallTool(DispatchContext& ctx, const JSONValue& params);
    DispatchResult onCancelled(DispatchContext& ctx, const JSONValue& params);
    DispatchResult onReadResource(const JSONValue& params);
    DispatchResult onSubscribe(DispatchContext& ctx, const JSONValue& params, bool subscribe);
    DispatchResult onGetPrompt(const JSONValue& params);
};

void ProtocolServer::Impl::buildMethodTable() {
    // Gate registered methods by session state; unknown names fall through to MethodNotFound
    methods.setOnBefore([this](const DispatchContext& ctx) {
        if (ctx.session == nullptr || !methods.contains(ctx.method)) {
            return;
        }
        if (auto err = ctx.session->lifecycle().checkAllowed(ctx.method)) {
            throw RpcException(err->code, err->message);
        }
    });

    methods.setOnError([](const DispatchContext& ctx, std::exception_ptr failure) -> DispatchResult {
        try {
            std::rethrow_exception(failure);
        } catch (const RpcException& e) {
            return DispatchResult::Failure(e.code(), e.what(), e.data());
        } catch (const std::exception& e) {
            LOG_ERROR("Handler for '{}' threw: {}", ctx.method, e.what());
            return DispatchResult::Failure(JSONRPCErrorCodes::InternalError, fmt::format("Internal error: {}", e.what()));
        } catch (...) {
            LOG_ERROR("Handler for '{}' threw a non-standard exception", ctx.method);
            return DispatchResult::Failure(JSONRPCErrorCodes::InternalError, "Internal error");
        }
    });

    methods.setOnFallback([](DispatchContext& ctx) {
        LOG_WARN("Method not found: {}", ctx.method);
        JSONValue data = emptyObject();
        SetMember(data, "method", JSONValue(ctx.method));
        return DispatchResult::Failure(JSONRPCErrorCodes::MethodNotFound, "Method not found", std::move(data));
    });

    methods.setOnAfter([](const DispatchContext& ctx, const DispatchResult& result) {
        if (result.isError()) {
            auto ec = errors::makeErrorContext(result.error->code, result.error->message, ctx.method, ctx.id);
            LOG_WARN("{}", ec.format());
        } else {
            LOG_DEBUG("{} {} completed", ctx.method, RequestIdToString(ctx.id));
        }
    });

    methods.add(Methods::Initialize, [this](DispatchContext& ctx, const JSONValue& params) {
        return onInitialize(ctx, params);
    });
    methods.add(Methods::Initialized, [](DispatchContext& ctx, const JSONValue&) {
        LOG_DEBUG("Client on {} confirmed initialization", ctx.session ? ctx.session->peer() : std::string("?"));
        return DispatchResult::None();
    });
    methods.add(Methods::Shutdown, [this](DispatchContext& ctx, const JSONValue&) {
        return onShutdown(ctx);
    });
    methods.add(Methods::ListTools, [this](DispatchContext&, const JSONValue&) {
        JSONValue result = emptyObject();
        SetMember(result, "tools", toJSONArray(registries.tools.list()));
        return DispatchResult::Success(std::move(result));
    });
    methods.add(Methods::CallTool, [this](DispatchContext& ctx, const JSONValue& params) {
        return onCallTool(ctx, params);
    });
    methods.add(Methods::Cancelled, [this](DispatchContext& ctx, const JSONValue& params) {
        return onCancelled(ctx, params);
    });
    methods.add(Methods::ListResources, [this](DispatchContext&, const JSONValue&) {
        JSONValue result = emptyObject();
        SetMember(result, "resources", toJSONArray(registries.resources.list()));
        return DispatchResult::Success(std::move(result));
    });
    methods.add(Methods::ReadResource, [this](DispatchContext&, const JSONValue& params) {
        return onReadResource(params);
    });
    methods.add(Methods::Subscribe, [this](DispatchContext& ctx, const JSONValue& params) {
        return onSubscribe(ctx, params, true);
    });
    methods.add(Methods::Unsubscribe, [this](DispatchContext& ctx, const JSONValue& params) {
        return onSubscribe(ctx, params, false);
    });
    methods.add(Methods::ListPrompts, [this](DispatchContext&, const JSONValue&) {
        JSONValue result = emptyObject();
        SetMember(result, "prompts", toJSONArray(registries.prompts.list()));
        return DispatchResult::Success(std::move(result));
    });
    methods.add(Methods::GetPrompt, [this](DispatchContext&, const JSONValue& params) {
        return onGetPrompt(params);
    });
}

JSONValue ProtocolServer::Impl::capabilities() const {
    JSONValue caps = emptyObject();
    if (!registries.tools.empty()) {
        JSONValue tools = emptyObject();
        SetMember(tools, "listChanged", JSONValue(false));
        SetMember(caps, "tools", std::move(tools));
    }
    if (!registries.resources.empty()) {
        JSONValue resources = emptyObject();
        SetMember(resources, "subscribe", JSONValue(true));
        SetMember(resources, "listChanged", JSONValue(false));
        SetMember(caps, "resources", std::move(resources));
    }
    if (!registries.prompts.empty()) {
        JSONValue prompts = emptyObject();
        SetMember(prompts, "listChanged", JSONValue(false));
        SetMember(caps, "prompts", std::move(prompts));
    }
    return caps;
}

DispatchResult ProtocolServer::Impl::onInitialize(DispatchContext& ctx, const JSONValue& params) {
    if (ctx.session == nullptr) {
        throw RpcException(JSONRPCErrorCodes::InternalError, "initialize requires a session");
    }
    Session& session = *ctx.session;
    Lifecycle& lifecycle = session.lifecycle();
    lifecycle.beginInitialize();

    if (!params.isObject()) {
        lifecycle.failInitialize();
        throw RpcException(JSONRPCErrorCodes::InvalidParams, "Initialize params must be an object");
    }
    if (const JSONValue* version = FindMember(params, "protocolVersion")) {
        if (!version->isString() || std::get<std::string>(version->value) != PROTOCOL_VERSION) {
            lifecycle.failInitialize();
            JSONValue data = emptyObject();
            SetMember(data, "supported", JSONValue(PROTOCOL_VERSION));
            SetMember(data, "requested", *version);
            throw RpcException(JSONRPCErrorCodes::UnknownProtocolVersion, "Unsupported protocol version", std::move(data));
        }
    }
    if (const JSONValue* clientInfo = FindMember(params, "clientInfo")) {
        session.setClientInfo(Implementation(GetString(*clientInfo, "name").value_or("unknown"),
                                             GetString(*clientInfo, "version").value_or("")));
    }
    lifecycle.completeInitialize();

    auto client = session.clientInfo();
    LOG_INFO("Session {} initialized (client: {} {})", session.peer(),
             client ? client->name : std::string("unknown"), client ? client->version : std::string());

    JSONValue result = emptyObject();
    SetMember(result, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    SetMember(result, "capabilities", capabilities());
    SetMember(result, "serverInfo", serverInfo.ToJSON());
    return DispatchResult::Success(std::move(result));
}

DispatchResult ProtocolServer::Impl::onShutdown(DispatchContext& ctx) {
    if (ctx.session != nullptr && ctx.session->lifecycle().shutdown()) {
        LOG_INFO("Session {} shutting down", ctx.session->peer());
    }
    return DispatchResult::Success(JSONValue{});
}

DispatchResult ProtocolServer::Impl::onCallTool(DispatchContext& ctx, const JSONValue& params) {
    const std::string name = requireString(params, "name");
    JSONValue arguments = objectArgument(params, "arguments");

    const ToolRegistry::Entry* entry = registries.tools.find(name);
    if (entry == nullptr) {
        throw RpcException(JSONRPCErrorCodes::UnknownTool, fmt::format("Tool not found: {}", name));
    }

    ToolCallContext toolCtx;
    toolCtx.memory = ctx.memory;
    if (const JSONValue* meta = FindMember(params, "_meta")) {
        if (const JSONValue* progressToken = FindMember(*meta, "progressToken")) {
            auto token = ProgressTokenFromJSON(*progressToken);
            ProgressNotifier* notifier = ctx.session ? ctx.session->getNotifier() : nullptr;
            if (token && notifier) {
                toolCtx.progress.emplace(*token, notifier);
            }
        }
    }

    // Cancellable tools get a token for the lifetime of this call only
    std::optional<CancellationGuard> guard;
    if (entry->tool.cancellable && ctx.id.has_value() && ctx.session != nullptr) {
        guard.emplace(ctx.session->cancellations(), ctx.id.value());
        toolCtx.cancellation = &guard->token();
        ctx.cancellation = toolCtx.cancellation;
    }

    CallToolResult result = entry->handler(toolCtx, arguments);
    if (toolCtx.progress.has_value()) {
        toolCtx.progress->completeAsync();
    }
    if (toolCtx.isCancelled()) {
        LOG_INFO("Tool '{}' returned after cancellation ({})", name,
                 toolCtx.cancellation->reason().value_or("no reason"));
    }
    return DispatchResult::Success(result.ToJSON());
}

DispatchResult ProtocolServer::Impl::onCancelled(DispatchContext& ctx, const JSONValue& params) {
    const JSONValue* idValue = FindMember(params, "requestId");
    if (idValue == nullptr) {
        idValue = FindMember(params, "id");
    }
    if (idValue == nullptr) {
        LOG_WARN("Cancellation notice without a request id");
        return DispatchResult::None();
    }
    IdReadResult id = RequestIdFromJSON(*idValue);
    if (!id.valid || !id.id.has_value()) {
        LOG_WARN("Cancellation notice with an invalid request id ({})", idValue->typeName());
        return DispatchResult::None();
    }
    // Only the sender's own requests; the same id on another connection is a different request
    if (ctx.session == nullptr || !ctx.session->cancellations().cancel(id.id.value(), GetString(params, "reason"))) {
        LOG_DEBUG("No in-flight request {} to cancel", RequestIdToString(id.id));
    }
    return DispatchResult::None();
}

DispatchResult ProtocolServer::Impl::onReadResource(const JSONValue& params) {
    const std::string uri = requireString(params, "uri");
    const ResourceRegistry::Entry* entry = registries.resources.find(uri);
    if (entry == nullptr) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Resource not found: {}", uri));
    }
    ResourceContent content = entry->reader(uri);
    JSONValue::Array contents;
    contents.push_back(std::make_shared<JSONValue>(content.ToJSON()));
    JSONValue result = emptyObject();
    SetMember(result, "contents", JSONValue(std::move(contents)));
    return DispatchResult::Success(std::move(result));
}

DispatchResult ProtocolServer::Impl::onSubscribe(DispatchContext& ctx, const JSONValue& params, bool subscribe) {
    const std::string uri = requireString(params, "uri");
    if (ctx.session == nullptr) {
        throw RpcException(JSONRPCErrorCodes::InternalError, "Subscriptions require a session");
    }
    if (subscribe) {
        if (registries.resources.find(uri) == nullptr) {
            throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Resource not found: {}", uri));
        }
        if (ctx.session->subscribe(uri)) {
            LOG_DEBUG("Session {} subscribed to {}", ctx.session->peer(), uri);
        }
    } else if (ctx.session->unsubscribe(uri)) {
        LOG_DEBUG("Session {} unsubscribed from {}", ctx.session->peer(), uri);
    }
    return DispatchResult::Success(emptyObject());
}

DispatchResult ProtocolServer::Impl::onGetPrompt(const JSONValue& params) {
    const std::string name = requireString(params, "name");
    JSONValue arguments = objectArgument(params, "arguments");
    const PromptRegistry::Entry* entry = registries.prompts.find(name);
    if (entry == nullptr) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Prompt not found: {}", name));
    }
    return DispatchResult::Success(entry->handler(arguments).ToJSON());
}

////////////////////////////////////////////// ProtocolServer //////////////////////////////////////////

ProtocolServer::ProtocolServer(Implementation serverInfo, const Registries& registries, std::size_t arenaBytes)
    : pImpl(std::make_unique<Impl>(std::move(serverInfo), registries, arenaBytes)) {}

ProtocolServer::~ProtocolServer() = default;

ProtocolServer::Outcome ProtocolServer::handleMessage(Session& session, const std::string& payload,
                                                      std::pmr::memory_resource* memory) {
    return handleDecoded(session, DecodeEnvelope(payload), memory);
}

ProtocolServer::Outcome ProtocolServer::handleDecoded(Session& session, const DecodeResult& decoded,
                                                      std::pmr::memory_resource* memory) {
    Outcome out;
    if (!decoded.ok()) {
        JSONRPCError err = decoded.error.value_or(JSONRPCError{JSONRPCErrorCodes::InvalidRequest, "Invalid Request", std::nullopt});
        LOG_WARN("{}", errors::makeErrorContext(err.code, err.message, std::nullopt, decoded.recoveredId).format());
        out.response = MakeErrorResponse(decoded.recoveredId, err.code, err.message, err.data).Serialize();
        return out;
    }

    const Envelope& envelope = decoded.envelope.value();
    if (const auto* response = std::get_if<JSONRPCResponse>(&envelope)) {
        LOG_DEBUG("Ignoring response {} from {}", RequestIdToString(response->id), session.peer());
        return out;
    }

    DispatchContext ctx;
    if (const auto* request = std::get_if<JSONRPCRequest>(&envelope)) {
        ctx.method = request->method;
        ctx.id = request->id;
        ctx.params = request->ParamsOrEmpty();
    } else {
        const auto& notification = std::get<JSONRPCNotification>(envelope);
        ctx.method = notification.method;
        ctx.params = notification.ParamsOrEmpty();
    }
    ctx.memory = memory;
    ctx.session = &session;

    DispatchResult result;
    try {
        result = pImpl->methods.dispatch(ctx);
    } catch (const RpcException& e) {
        // Rejected by the lifecycle gate (before hook)
        LOG_WARN("{}", errors::makeErrorContext(e.code(), e.what(), ctx.method, ctx.id).format());
        result = DispatchResult::Failure(e.code(), e.what(), e.data());
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch of '{}' failed: {}", ctx.method, e.what());
        result = DispatchResult::Failure(JSONRPCErrorCodes::InternalError, fmt::format("Internal error: {}", e.what()));
    }

    if (!ctx.isNotification()) {
        JSONRPCResponse response;
        switch (result.kind) {
            case DispatchResult::Kind::Result:
                response = MakeResultResponse(ctx.id, result.result.value_or(JSONValue{}));
                break;
            case DispatchResult::Kind::Error:
                response = MakeErrorResponse(ctx.id, result.error->code, result.error->message, result.error->data);
                break;
            case DispatchResult::Kind::None:
            case DispatchResult::Kind::EndStream:
                // A request always gets an answer
                response = MakeResultResponse(ctx.id, JSONValue{});
                break;
        }
        // Built in the request arena; only the finished text outlives the cycle
        const std::pmr::string text = response.Serialize(memory);
        out.response = std::string(text.data(), text.size());
    }
    if (result.kind == DispatchResult::Kind::EndStream || session.lifecycle().isTerminal()) {
        out.closeConnection = true;
    }
    return out;
}

bool ProtocolServer::IsCancellationNotice(const DecodeResult& decoded) {
    if (!decoded.ok()) {
        return false;
    }
    const auto* notification = std::get_if<JSONRPCNotification>(&decoded.envelope.value());
    return notification != nullptr && notification->method == Methods::Cancelled;
}

void ProtocolServer::addMethod(const std::string& method, MethodHandler handler) {
    pImpl->methods.add(method, std::move(handler));
}

void ProtocolServer::attachSession(Session& session) {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    pImpl->sessions.push_back(&session);
}

void ProtocolServer::detachSession(Session& session) {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    auto& v = pImpl->sessions;
    v.erase(std::remove(v.begin(), v.end(), &session), v.end());
}

std::size_t ProtocolServer::sessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

std::size_t ProtocolServer::notifyResourceUpdated(const std::string& uri) {
    JSONValue params = emptyObject();
    SetMember(params, "uri", JSONValue(uri));
    const std::string json = JSONRPCNotification{Methods::ResourceUpdated, std::move(params)}.Serialize();

    std::size_t notified = 0;
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    for (Session* s : pImpl->sessions) {
        ProgressNotifier* notifier = s->getNotifier();
        if (notifier != nullptr && s->isSubscribed(uri)) {
            notifier->notifyAsync(json);
            ++notified;
        }
    }
    LOG_DEBUG("Resource {} updated; notified {} session(s)", uri, notified);
    return notified;
}

ArenaPool& ProtocolServer::arenas() {
    return pImpl->pool;
}

const Implementation& ProtocolServer::info() const {
    return pImpl->serverInfo;
}

} // namespace mcpengine
