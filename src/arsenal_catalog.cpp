#include "arsenal_catalog.h"
#include "arsenal_logger.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace arsenal {

    namespace {

        std::string to_upper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return s;
        }

        std::string join(const std::vector<std::string>& items, const std::string& separator) {
            std::string out;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    out += separator;
                }
                out += items[i];
            }
            return out;
        }

        // Stable per-repository figure for the status page
        int repository_tool_count(const std::string& repository) {
            unsigned int sum = 0;
            for (unsigned char c : repository) {
                sum = sum * 31 + c;
            }
            return 50 + static_cast<int>(sum % 100);
        }

        // Absent or empty arguments fall back; a non-string value is a caller error
        std::string string_argument(const json& arguments, const char* key, const std::string& fallback) {
            if (!arguments.contains(key) || arguments[key].is_null()) {
                return fallback;
            }
            if (!arguments[key].is_string()) {
                throw std::invalid_argument(std::string("'") + key + "' must be a string");
            }
            std::string value = arguments[key].get<std::string>();
            return value.empty() ? fallback : value;
        }

    } // namespace

    arsenal_catalog::arsenal_catalog(std::string platform)
        : platform_(std::move(platform)) {
        categories_ = {
            {"Information Gathering", 85, "Complete reconnaissance and intelligence gathering tools", true,
                {"nmap", "masscan", "zmap", "unicornscan", "dmitry", "netdiscover",
                 "nbtscan", "enum4linux", "smbclient", "rpcclient", "showmount",
                 "snmpwalk", "snmpcheck", "onesixtyone", "sipvicious", "whatweb",
                 "wafw00f", "httprint", "fierce", "dnsenum", "dnsrecon", "dnsmap",
                 "sublist3r", "theharvester", "metagoofil", "recon-ng", "maltego",
                 "subfinder", "httpx", "katana", "nuclei", "naabu", "dnsx",
                 "rustscan", "feroxbuster", "httpx-toolkit", "katana-crawler",
                 "interactsh", "notify", "chaos-client", "dnsprobe", "shuffledns"}},
            {"Vulnerability Analysis", 62, "Advanced vulnerability scanning and analysis tools", true,
                {"openvas", "nikto", "w3af", "skipfish", "wapiti", "sqlmap",
                 "commix", "bed", "lynis", "unix-privesc-check", "nuclei",
                 "linux-exploit-suggester", "windows-exploit-suggester",
                 "nuclei-templates", "neural-fuzzing", "ai-security-toolkit"}},
            {"Web Applications", 58, "Complete web application security testing suite", true,
                {"owasp-zap", "burpsuite", "webscarab", "proxystrike", "vega",
                 "sqlninja", "bbqsql", "jsql-injection", "hexorbase", "dirb",
                 "dirbuster", "gobuster", "feroxbuster", "ffuf", "wfuzz",
                 "cariddi", "gau", "waybackurls", "gf", "anew", "unfurl"}},
            {"Password Attacks", 42, "Advanced password cracking and analysis tools", true,
                {"john", "hashcat", "hydra", "medusa", "ncrack", "patator",
                 "crowbar", "cewl", "crunch", "cupp", "rsmangler", "wordlists",
                 "hashcat-utils-ng", "john-jumbo-ng", "maskprocessor-ng"}},
            {"Wireless Attacks", 38, "Complete wireless security testing arsenal", true,
                {"aircrack-ng", "airmon-ng", "airodump-ng", "aireplay-ng",
                 "wifite", "reaver", "bully", "pixiewps", "wash", "mdk3",
                 "wifipumpkin3", "eaphammer-ng", "wifi-arsenal", "bluetooth-arsenal"}},
            {"Exploitation Tools", 55, "Advanced exploitation frameworks and tools", true,
                {"metasploit-framework", "armitage", "empire", "covenant",
                 "sliver", "merlin", "pupy", "koadic", "veil", "shellter",
                 "sliver-client", "merlin-agent", "covenant-client", "havoc-framework"}},
            {"Forensics", 48, "Digital forensics and incident response tools", true,
                {"volatility", "autopsy", "sleuthkit", "foremost", "binwalk",
                 "bulk-extractor", "chkrootkit", "rkhunter", "aide", "ossec",
                 "volatility3", "autopsy-ng", "sleuthkit-ng", "yara-ng"}},
            {"Reverse Engineering", 35, "Complete reverse engineering and analysis tools", true,
                {"gdb", "radare2", "ida-free", "ghidra", "objdump", "strings",
                 "ltrace", "strace", "hexedit", "bless", "dhex", "okteta"}},
            {"Hardware Hacking", 28, "Hardware security and IoT testing tools", true,
                {"minicom", "screen", "picocom", "openocd", "avrdude",
                 "flashrom", "dediprog", "bus-pirate", "arduino", "platformio",
                 "iot-toolkit", "hardware-hacking-ng", "firmware-analysis-ng"}},
            {"Crypto & Stego", 32, "Cryptography and steganography analysis tools", true,
                {"hashcat", "john", "steghide", "outguess", "foremost",
                 "binwalk", "exiftool", "fcrackzip", "pdfcrack", "rarcrack"}},
            {"Reporting Tools", 25, "Professional security assessment reporting", true,
                {"cutycapt", "faraday", "dradis", "magictree", "case-file",
                 "maltego", "recordmydesktop", "kazam", "vokoscreen", "simplescreenrecorder"}},
            {"Social Engineering", 22, "Social engineering and OSINT tools", true,
                {"set", "beef", "king-phisher", "gophish", "evilginx2",
                 "catphish", "weeman", "blackeye", "shellphish", "zphisher",
                 "osint-toolkit-ng", "social-analyzer-ng", "sherlock-ng"}},
            {"Sniffing & Spoofing", 31, "Network analysis and manipulation tools", true,
                {"wireshark", "tshark", "tcpdump", "ettercap", "dsniff",
                 "arpspoof", "ettercap-ng", "bettercap", "mitmproxy", "sslstrip",
                 "packet-analysis-ng", "network-intercept-toolkit"}}
        };

        bleeding_edge_ = {
            true,
            "high",
            {"kali-bleeding-edge", "kali-experimental", "kali-dev"},
            150,
            "4_hours"
        };

        standard_tool_count_ = std::accumulate(categories_.begin(), categories_.end(), 0,
            [](int sum, const tool_category& c) { return sum + c.count; });
    }

    const tool_category* arsenal_catalog::find(const std::string& name) const {
        auto it = std::find_if(categories_.begin(), categories_.end(), [&name](const tool_category& c) {
            return c.name == name;
        });
        return it == categories_.end() ? nullptr : &*it;
    }

    std::string arsenal_catalog::render_arsenal_info() const {
        std::ostringstream out;
        std::string frequency = bleeding_edge_.update_frequency;
        std::replace(frequency.begin(), frequency.end(), '_', ' ');

        out << "BLEEDING EDGE KALI LINUX ARSENAL - COMPLETE OVERVIEW\n\n"
            << "**TOTAL ARSENAL: " << total_tool_count() << " CYBERSECURITY TOOLS**\n"
            << "- **Standard Kali Tools**: " << standard_tool_count_ << "\n"
            << "- **Bleeding Edge Tools**: " << bleeding_edge_.additional_tools_count << "\n"
            << "- **Security Categories**: " << categories_.size() << "\n"
            << "- **Platform**: " << platform_ << "\n\n"
            << "**BLEEDING EDGE ENHANCEMENT:**\n"
            << "- **Status**: " << (bleeding_edge_.enabled ? "ACTIVE" : "INACTIVE") << "\n"
            << "- **Priority**: " << to_upper(bleeding_edge_.priority) << "\n"
            << "- **Repositories**: " << join(bleeding_edge_.repositories, ", ") << "\n"
            << "- **Auto-Sync**: Every " << frequency << "\n\n"
            << "**CATEGORY BREAKDOWN:**\n";

        for (const auto& category : categories_) {
            out << "- **" << category.name << "**: " << category.count << " tools"
                << (category.bleeding_edge_enhanced ? " (Bleeding Edge Enhanced)" : "") << "\n"
                << "  *" << category.description << "*\n";
        }

        out << "\nMCP INTEGRATION:\n"
            << "- **Protocol**: MCP " << ARSENAL_PROTOCOL_VERSION << "\n"
            << "- **Transport**: Server-Sent Events (SSE)\n";

        return out.str();
    }

    tool_result arsenal_catalog::render_category(const std::string& name) const {
        const tool_category* category = find(name);
        if (category == nullptr) {
            std::vector<std::string> names;
            for (const auto& c : categories_) {
                names.push_back(c.name);
            }
            return tool_result::failure("Invalid category. Available categories: " + join(names, ", "));
        }

        std::ostringstream out;
        out << to_upper(category->name) << " - "
            << (category->bleeding_edge_enhanced ? "BLEEDING EDGE ENHANCED" : "STANDARD") << "\n\n"
            << "**Category Statistics:**\n"
            << "- **Tool Count**: " << category->count << "\n"
            << "- **Description**: " << category->description << "\n"
            << "- **Bleeding Edge**: " << (category->bleeding_edge_enhanced ? "Enhanced" : "Standard") << "\n\n"
            << "**Available Tools:**\n";

        int index = 1;
        for (const auto& t : category->tools) {
            out << std::setw(2) << index++ << ". " << t << "\n";
        }

        return tool_result::success(out.str());
    }

    std::string arsenal_catalog::render_scan(const std::string& target, const std::string& scan_type) const {
        std::ostringstream out;
        out << "BLEEDING EDGE SECURITY SCAN (SIMULATED)\n\n"
            << "**Scan Configuration:**\n"
            << "- **Target**: " << target << "\n"
            << "- **Scan Type**: " << to_upper(scan_type) << "\n"
            << "- **Platform**: " << platform_ << "\n"
            << "- **Bleeding Edge**: ENHANCED\n\n";

        if (scan_type == "reconnaissance") {
            out << "**RECONNAISSANCE PHASE:**\n"
                << "rustscan, nmap, feroxbuster, subfinder, httpx-toolkit, nuclei, katana-crawler\n\n"
                << "**RECONNAISSANCE RESULTS:**\n"
                << "- **Open Ports**: 22, 80, 443, 8080\n"
                << "- **Services**: SSH, HTTP, HTTPS, Web Proxy\n"
                << "- **Subdomains**: 15 discovered\n"
                << "- **Vulnerabilities**: 3 potential issues identified\n";
        } else if (scan_type == "vulnerability") {
            out << "**VULNERABILITY ANALYSIS:**\n"
                << "nuclei-templates, openvas, neural-fuzzing, sqlmap, ai-security-toolkit\n\n"
                << "**VULNERABILITY RESULTS:**\n"
                << "- **Critical**: 0 findings\n"
                << "- **High**: 2 findings\n"
                << "- **Medium**: 5 findings\n"
                << "- **Low**: 12 findings\n";
        } else if (scan_type == "web") {
            out << "**WEB APPLICATION SECURITY:**\n"
                << "cariddi, owasp-zap, gau, burpsuite, waybackurls\n\n"
                << "**WEB SECURITY RESULTS:**\n"
                << "- **Endpoints**: 147 discovered\n"
                << "- **Parameters**: 89 tested\n"
                << "- **XSS Potential**: 2 locations\n"
                << "- **Security Headers**: 3 missing headers identified\n";
        } else if (scan_type == "comprehensive") {
            out << "**COMPREHENSIVE ASSESSMENT:**\n"
                << "All " << categories_.size() << " security categories deployed:\n";
            for (const auto& category : categories_) {
                out << category.name << " (" << category.count << " tools)\n";
            }
            out << "\n**COMPREHENSIVE RESULTS:**\n"
                << "- **Risk Level**: MEDIUM\n"
                << "- **Compliance**: 87% security baseline achievement\n";
        }

        out << "\nMCP INTEGRATION:\n"
            << "Results available via SSE transport for real-time analysis\n";

        return out.str();
    }

    std::string arsenal_catalog::render_bleeding_edge_status() const {
        std::ostringstream out;
        out << "BLEEDING EDGE REPOSITORY STATUS\n\n"
            << "**CURRENT STATUS:**\n"
            << "- **Status**: " << (bleeding_edge_.enabled ? "ACTIVE" : "INACTIVE") << "\n"
            << "- **Priority Level**: " << to_upper(bleeding_edge_.priority) << "\n\n"
            << "**BLEEDING EDGE REPOSITORIES:**\n";

        for (const auto& repository : bleeding_edge_.repositories) {
            out << "**" << repository << "**: Active, " << repository_tool_count(repository) << " tools available\n";
        }

        out << "\n**REAL-TIME MCP INTEGRATION:**\n"
            << "- **Protocol**: MCP " << ARSENAL_PROTOCOL_VERSION << " compliant\n"
            << "- **Transport**: Server-Sent Events for real-time updates\n"
            << "- **Platform**: " << platform_ << "\n\n"
            << "**ETHICAL USE NOTICE:**\n"
            << "Bleeding edge tools are designed for authorized security research and testing only.\n";

        return out.str();
    }

    std::string arsenal_catalog::render_report(const std::string& report_type) const {
        std::ostringstream out;
        out << "BLEEDING EDGE SECURITY ASSESSMENT REPORT\n\n"
            << "**REPORT METADATA:**\n"
            << "- **Report Type**: " << to_upper(report_type) << "\n"
            << "- **Platform**: " << platform_ << "\n"
            << "- **Arsenal**: " << total_tool_count() << " cybersecurity tools\n"
            << "- **Bleeding Edge**: Enhanced with " << bleeding_edge_.additional_tools_count << " experimental tools\n\n"
            << "**SECURITY CATEGORY COVERAGE:**\n";

        for (const auto& category : categories_) {
            out << "- **" << category.name << "**: " << category.count << " tools"
                << (category.bleeding_edge_enhanced ? " (Bleeding Edge Enhanced)" : "") << "\n";
        }

        if (report_type == "comprehensive") {
            out << "\n**RISK ASSESSMENT:**\n"
                << "- **Critical Risk**: 0%\n"
                << "- **High Risk**: 5%\n"
                << "- **Medium Risk**: 15%\n"
                << "- **Low Risk**: 80%\n";
        } else if (report_type == "executive") {
            out << "\n**EXECUTIVE OVERVIEW:**\n"
                << "**SECURITY POSTURE:** STRONG\n"
                << "- **Tools Deployed**: " << total_tool_count() << " cybersecurity tools\n"
                << "- **Coverage**: " << categories_.size() << " security categories\n"
                << "- **Risk Level**: LOW to MEDIUM\n";
        } else if (report_type == "technical") {
            out << "\n**TECHNICAL ASSESSMENT DETAILS:**\n"
                << "- **Standard Kali Arsenal**: " << standard_tool_count_ << " tools across "
                << categories_.size() << " categories\n"
                << "- **Bleeding Edge Enhancement**: " << bleeding_edge_.additional_tools_count << " experimental tools\n"
                << "- **MCP Integration**: Real-time analysis via SSE transport\n";
        } else if (report_type == "compliance") {
            out << "\n**COMPLIANCE ASSESSMENT:**\n"
                << "**NIST Cybersecurity Framework**: Complete coverage across all functions\n"
                << "**ISO 27001**: Security controls assessment\n"
                << "**PCI DSS**: Payment card security evaluation\n"
                << "**COMPLIANCE SCORE:** 92%\n";
        }

        out << "\n**MCP INTEGRATION STATUS:**\n"
            << "- **Protocol Compliance**: MCP " << ARSENAL_PROTOCOL_VERSION << "\n";

        return out.str();
    }

    json default_capabilities() {
        return {
            {"tools", {{"listChanged", false}}},
            {"bleeding_edge", true},
            {"auto_updates", true},
            {"experimental_tools", true},
            {"gradio_interface", true},
            {"mcp_integration", true},
            {"unified_platform", true},
            {"gemini_3_pro_preview", true}
        };
    }

    void register_catalog_tools(tool_registry& registry,
            std::shared_ptr<const arsenal_catalog> catalog,
            std::shared_ptr<tracer> tracer) {
        if (!catalog) {
            throw std::invalid_argument("register_catalog_tools requires a catalog");
        }

        registry.register_tool(
            tool_builder("get_complete_kali_arsenal_info")
                .with_description("Get complete information about the bleeding edge Kali Linux arsenal")
                .build(),
            [catalog](const json&) {
                return tool_result::success(catalog->render_arsenal_info());
            });

        registry.register_tool(
            tool_builder("get_kali_tool_category")
                .with_description("Get detailed information about a specific Kali Linux tool category")
                .with_string_param("category_name", "Name of the tool category")
                .build(),
            [catalog](const json& arguments) {
                return catalog->render_category(string_argument(arguments, "category_name", ""));
            });

        registry.register_tool(
            tool_builder("run_kali_security_scan")
                .with_description("Run comprehensive security scan using bleeding edge enhanced tools")
                .with_string_param("target", "Target for security scanning")
                .with_string_param("scan_type", "Type of scan (reconnaissance, vulnerability, web, etc.)", false)
                .build(),
            [catalog, tracer](const json& arguments) {
                std::string target = string_argument(arguments, "target", "example.com");
                std::string scan_type = string_argument(arguments, "scan_type", "reconnaissance");

                std::unique_ptr<scoped_span> span;
                if (tracer) {
                    span = tracer->span("security.scan");
                    span->set_attribute("scan.target", target);
                    span->set_attribute("scan.type", scan_type);
                    span->set_attribute("scan.bleeding_edge", catalog->bleeding_edge().enabled);
                }

                std::string text;
                try {
                    text = catalog->render_scan(target, scan_type);
                } catch (const std::exception& e) {
                    if (span) {
                        span->set_attribute("scan.success", false);
                        span->set_attribute("scan.error", e.what());
                        span->record_error(e.what());
                    }
                    throw;
                }

                if (span) {
                    span->set_attribute("scan.success", true);
                    span->set_attribute("scan.result_length", text.size());
                }
                return tool_result::success(text);
            });

        registry.register_tool(
            tool_builder("get_bleeding_edge_status")
                .with_description("Get comprehensive bleeding edge repository status and capabilities")
                .build(),
            [catalog](const json&) {
                return tool_result::success(catalog->render_bleeding_edge_status());
            });

        registry.register_tool(
            tool_builder("generate_kali_security_report")
                .with_description("Generate professional security assessment reports")
                .with_string_param("report_type", "Type of report (comprehensive, executive, technical, compliance)", false)
                .build(),
            [catalog](const json& arguments) {
                std::string report_type = string_argument(arguments, "report_type", "comprehensive");
                return tool_result::success(catalog->render_report(report_type));
            });

        LOG_INFO("Registered ", registry.size(), " catalog tools");
    }

} // namespace arsenal
