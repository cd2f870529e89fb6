#include "utils.h"

#include <cstdlib>

#include <sys/wait.h> // WIFEXITED/WEXITSTATUS/WIFSIGNALED

#include "spdlog/spdlog.h"

namespace cmd
{
    std::vector<std::string> missingPlaceholders(std::string_view cmd_template,
                                                 const std::vector<std::string>& required)
    {
        std::vector<std::string> missing;
        for (const auto& name : required) {
            if (cmd_template.find("{" + name + "}") == std::string_view::npos) {
                missing.push_back(name);
            }
        }
        return missing;
    }

    // 单遍扫描展开 {name}；替换值不会被再次展开
    static std::string expand(std::string_view tmpl, const Placeholders& values)
    {
        std::string out;
        out.reserve(tmpl.size() + 128);

        std::size_t pos = 0;
        while (pos < tmpl.size()) {
            const std::size_t open = tmpl.find('{', pos);
            if (open == std::string_view::npos) break;
            const std::size_t close = tmpl.find('}', open + 1);
            if (close == std::string_view::npos) break;

            out.append(tmpl, pos, open - pos);
            const auto it = values.find(std::string(tmpl.substr(open + 1, close - open - 1)));
            if (it != values.end()) {
                out += it->second;
            } else {
                out.append(tmpl, open, close - open + 1);
            }
            pos = close + 1;
        }
        out.append(tmpl, pos, std::string_view::npos);
        return out;
    }

    // 只做字符串替换，不做 shell 转义；模板来自命令行，视为可信输入
    std::string buildCommand(std::string_view cmd_template,
                             const Placeholders& values,
                             const BuildOptions& opt)
    {
        const auto missing = missingPlaceholders(cmd_template, opt.required);
        if (!missing.empty()) {
            throw std::runtime_error("cmd template missing {" + missing.front() + "}: " + std::string(cmd_template));
        }

        std::string command = expand(cmd_template, values);

        if (opt.quiet) {
            // 模板自己重定向了 stdout（例如 "> {output}"）时不能再覆盖它
            command += (command.find('>') != std::string::npos) ? " 2>/dev/null" : " > /dev/null 2>&1";
        }
        if (opt.close_stdin) {
            command += " < /dev/null";
        }
        return command;
    }

    int runCommand(const std::string& command)
    {
        const int status = std::system(command.c_str());
        if (status == -1) {
            spdlog::error("system() failed for command: {}", command);
            return -1;
        }
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            spdlog::warn("command terminated by signal {}: {}", WTERMSIG(status), command);
            return 128 + WTERMSIG(status);
        }
        return status;
    }

} // namespace cmd
