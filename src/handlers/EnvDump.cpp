#include "../cgi/IHandler.hpp"
#include "../cgi/HandlerContext.hpp"
#include "../core/Environment.hpp"
#include "../util/Html.hpp"

class EnvDump : public IHandler {
public:
    std::string name() const override { return "env_dump"; }
    int execute(HandlerContext& ctx) override {
        ctx.out << R"HTML(<!DOCTYPE html>
<html>
<head>
    <title>CGI Environment Dump</title>
    <style>
        body { font-family: monospace; background: #f4f4f4; }
        table { border-collapse: collapse; width: 100%; }
        th, td { border: 1px solid #999; padding: 6px; }
        th { background: #ddd; }
        tr:nth-child(even) { background: #eee; }
    </style>
</head>
<body>
<h1>CGI Environment Variables</h1>
<table>
<tr><th>Variable</th><th>Value</th></tr>
)HTML";
        for (auto& kv : ctx.env.list()) {
            ctx.out << "<tr><td>" << Html::escape(kv.first) << "</td>"
                    << "<td>" << Html::escape(kv.second) << "</td></tr>\n";
        }
        ctx.out << "</table>\n</body>\n</html>\n";
        return 0;
    }
};

namespace Handlers { std::unique_ptr<IHandler> make_env_dump(){ return std::make_unique<EnvDump>(); } }
