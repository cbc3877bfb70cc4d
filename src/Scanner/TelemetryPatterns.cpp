/*
 * TraceSweep - Browser Artifact Detection and Removal Engine
 * Copyright (C) 2026 TraceSweep Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "TelemetryPatterns.hpp"
#include "BoundedRegex.hpp"

#include "../Utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace TraceSweep {
namespace Scanner {

std::string TelemetryPatternDefinition::ToJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["pattern"] = pattern;
    j["risk"] = TelemetryRiskToString(risk);
    j["category"] = category;
    j["description"] = description;
    j["examples"] = examples;
    return j.dump();
}

const TelemetryPatternCatalog& TelemetryPatternCatalog::Instance() {
    static const TelemetryPatternCatalog instance;
    return instance;
}

TelemetryPatternCatalog::TelemetryPatternCatalog() {
    // Direct telemetry implementation
    add("telemetry_reporter_new", TelemetryRisk::Critical, "Direct Telemetry",
        R"re(new\s+TelemetryReporter\s*\()re",
        "Creates a new TelemetryReporter instance for data collection",
        { "new TelemetryReporter(extensionId, extensionVersion, key)",
          "const reporter = new TelemetryReporter(...)" });

    add("telemetry_reporter_import", TelemetryRisk::Critical, "Direct Telemetry",
        R"re((?:import|require)\s*.*(?:@vscode/extension-telemetry|vscode-extension-telemetry))re",
        "Imports VS Code telemetry library",
        { "import TelemetryReporter from '@vscode/extension-telemetry'",
          "const TelemetryReporter = require('vscode-extension-telemetry')" });

    add("telemetry_send_event", TelemetryRisk::Critical, "Direct Telemetry",
        R"re(\.sendTelemetryEvent\s*\()re",
        "Actively sends telemetry events",
        { "reporter.sendTelemetryEvent('eventName', properties)",
          "this.telemetryReporter.sendTelemetryEvent(...)" });

    add("telemetry_send_exception", TelemetryRisk::Critical, "Direct Telemetry",
        R"re(\.sendTelemetryException\s*\()re",
        "Sends exception/error telemetry",
        { "reporter.sendTelemetryException(error, properties)" });

    // Machine and user identification
    add("vscode_machine_id", TelemetryRisk::High, "Machine Identification",
        R"re(vscode\.env\.machineId)re",
        "Accesses VS Code's unique machine identifier",
        { "const machineId = vscode.env.machineId",
          "properties.machineId = vscode.env.machineId" });

    add("vscode_session_id", TelemetryRisk::High, "Session Identification",
        R"re(vscode\.env\.sessionId)re",
        "Accesses VS Code's session identifier",
        { "const sessionId = vscode.env.sessionId" });

    add("vscode_remote_name", TelemetryRisk::High, "Environment Identification",
        R"re(vscode\.env\.remoteName)re",
        "Identifies remote development environment",
        { "const remoteName = vscode.env.remoteName" });

    add("os_hostname", TelemetryRisk::High, "System Identification",
        R"re(os\.hostname\s*\(\))re",
        "Gets system hostname for identification",
        { "const hostname = os.hostname()",
          "properties.hostname = os.hostname()" });

    add("process_env_user", TelemetryRisk::High, "User Identification",
        R"re(process\.env\.(?:USER|USERNAME|COMPUTERNAME))re",
        "Accesses system user/computer name",
        { "process.env.USER", "process.env.USERNAME", "process.env.COMPUTERNAME" });

    // Network communication
    add("fetch_request", TelemetryRisk::Medium, "Network Communication",
        R"re(fetch\s*\()re",
        "Makes HTTP requests that could send data",
        { "fetch('https://api.example.com/telemetry', options)",
          "await fetch(url, { method: 'POST', body: data })" });

    add("axios_request", TelemetryRisk::Medium, "Network Communication",
        R"re(axios\s*\.(?:get|post|put|delete|request))re",
        "Makes HTTP requests using Axios library",
        { "axios.post('https://analytics.com', data)",
          "axios.get(telemetryEndpoint)" });

    add("http_request", TelemetryRisk::Medium, "Network Communication",
        R"re(https?\.request\s*\()re",
        "Makes HTTP requests using Node.js http module",
        { "http.request(options, callback)",
          "https.request(url, options)" });

    add("xmlhttprequest", TelemetryRisk::Medium, "Network Communication",
        R"re(new\s+XMLHttpRequest\s*\(\))re",
        "Creates XMLHttpRequest for web requests",
        { "const xhr = new XMLHttpRequest()" });

    add("navigator_useragent", TelemetryRisk::Medium, "Browser Fingerprinting",
        R"re(navigator\.userAgent)re",
        "Accesses browser user agent string",
        { "const userAgent = navigator.userAgent" });

    // Analytics services
    add("appinsights_import", TelemetryRisk::High, "Analytics Service",
        R"re((?:import|require)\s*.*applicationinsights)re",
        "Imports Microsoft Application Insights",
        { "import * as appInsights from 'applicationinsights'",
          "const appInsights = require('applicationinsights')" });

    add("appinsights_track", TelemetryRisk::High, "Analytics Service",
        R"re(\.track(?:Event|Exception|Metric|Request|Dependency)\s*\()re",
        "Tracks events using Application Insights",
        { "client.trackEvent({ name: 'eventName' })",
          "appInsights.defaultClient.trackException({ exception: error })" });

    // General analytics references
    add("analytics_reference", TelemetryRisk::Low, "Analytics Reference",
        R"re((?:analytics|tracking|metrics|usage)\s*[:=])re",
        "References to analytics or tracking functionality",
        { "const analytics = require('./analytics')",
          "tracking: true" });

    add("performance_now", TelemetryRisk::Low, "Performance Tracking",
        R"re(performance\.now\s*\(\))re",
        "Measures performance timing",
        { "const start = performance.now()" });

    add("console_log_data", TelemetryRisk::Low, "Data Logging",
        R"re(console\.(?:log|info|warn|error)\s*\([^)]*(?:user|data|info|event))re",
        "Logs potentially sensitive data to console",
        { "console.log('User data:', userData)",
          "console.info('Event:', eventData)" });

    // Storage
    add("localstorage_access", TelemetryRisk::Medium, "Local Storage",
        R"re(localStorage\.(?:getItem|setItem|removeItem))re",
        "Accesses browser local storage",
        { "localStorage.setItem('telemetry', data)",
          "const stored = localStorage.getItem('analytics')" });

    add("sessionstorage_access", TelemetryRisk::Medium, "Session Storage",
        R"re(sessionStorage\.(?:getItem|setItem|removeItem))re",
        "Accesses browser session storage",
        { "sessionStorage.setItem('session', data)" });

    add("document_cookie", TelemetryRisk::Medium, "Cookie Access",
        R"re(document\.cookie)re",
        "Accesses browser cookies",
        { "document.cookie = 'tracking=enabled'",
          "const cookies = document.cookie" });

    // Extension specific
    add("vscode_workspace_config", TelemetryRisk::Low, "Configuration Access",
        R"re(vscode\.workspace\.getConfiguration\s*\([^)]*(?:telemetry|analytics|tracking))re",
        "Accesses telemetry-related configuration",
        { "vscode.workspace.getConfiguration('telemetry')",
          "getConfiguration('myext.analytics')" });

    add("extension_context_global", TelemetryRisk::Medium, "Extension Storage",
        R"re(context\.globalState\.(?:get|update))re",
        "Accesses extension global state storage",
        { "context.globalState.update('telemetryData', data)",
          "const stored = context.globalState.get('analytics')" });

    add("extension_context_workspace", TelemetryRisk::Low, "Extension Storage",
        R"re(context\.workspaceState\.(?:get|update))re",
        "Accesses extension workspace state storage",
        { "context.workspaceState.update('usage', stats)" });
}

void TelemetryPatternCatalog::add(const char* name, TelemetryRisk risk, const char* category, const char* pattern,
    const char* description, std::vector<std::string> examples) {
    TelemetryPatternDefinition def;
    def.name = name;
    def.pattern = pattern;
    def.risk = risk;
    def.category = category;
    def.description = description;
    def.examples = std::move(examples);
    def.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    m_patterns.push_back(std::move(def));
}

const TelemetryPatternDefinition* TelemetryPatternCatalog::Find(std::string_view name) const noexcept {
    for (const auto& def : m_patterns) {
        if (def.name == name) return &def;
    }
    return nullptr;
}

std::vector<const TelemetryPatternDefinition*> TelemetryPatternCatalog::MatchLine(const std::string& line) const {
    std::vector<const TelemetryPatternDefinition*> hits;
    for (const auto& def : m_patterns) {
        if (BoundedSearch(line, def.regex)) hits.push_back(&def);
    }
    return hits;
}

std::vector<const TelemetryPatternDefinition*> TelemetryPatternCatalog::ByRisk(TelemetryRisk risk) const {
    std::vector<const TelemetryPatternDefinition*> out;
    for (const auto& def : m_patterns) {
        if (def.risk == risk) out.push_back(&def);
    }
    return out;
}

std::vector<const TelemetryPatternDefinition*> TelemetryPatternCatalog::ByCategory(std::string_view category) const {
    std::vector<const TelemetryPatternDefinition*> out;
    for (const auto& def : m_patterns) {
        if (Utils::StringUtils::IEquals(def.category, category)) out.push_back(&def);
    }
    return out;
}

const char* TelemetryPatternCatalog::RiskDescription(TelemetryRisk risk) noexcept {
    switch (risk) {
        case TelemetryRisk::Critical:
            return "Critical: Actively collects and transmits telemetry data";
        case TelemetryRisk::High:
            return "High: Accesses machine/user identification or sends data to external services";
        case TelemetryRisk::Medium:
            return "Medium: Has network communication capabilities or accesses local storage";
        case TelemetryRisk::Low:
            return "Low: Contains references to analytics/tracking but limited data collection";
        case TelemetryRisk::None:
            return "None: No telemetry patterns detected";
        default:
            return "Unknown risk level";
    }
}

} // namespace Scanner
} // namespace TraceSweep
