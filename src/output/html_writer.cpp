/**
 * HTML Writer Implementation
 */

#include "html_writer.hpp"
#include "json_writer.hpp"

#include <sstream>

namespace xsys {
namespace output {

namespace {

constexpr const char* PAGE_STYLE = R"CSS(
        body {
            font-family: Arial, sans-serif;
            background-color: #f4f4f9;
            margin: 0;
            padding: 20px;
        }
        .container {
            background: white;
            padding: 2rem;
            border-radius: 8px;
            box-shadow: 0 4px 6px rgba(0, 0, 0, 0.1);
            max-width: 800px;
            margin: 0 auto;
        }
        h1 {
            font-size: 1.5rem;
            color: #333;
            margin-bottom: 1.5rem;
            text-align: center;
        }
        .statement {
            margin-bottom: 1rem;
            padding: 1rem;
            background: #f9f9f9;
            border-radius: 4px;
            border: 1px solid #ddd;
        }
        .options {
            display: flex;
            gap: 1rem;
        }
        .options label {
            display: flex;
            align-items: center;
            gap: 0.5rem;
            color: #666;
        }
        button {
            background: #007bff;
            color: white;
            border: none;
            padding: 0.75rem 1.5rem;
            border-radius: 4px;
            cursor: pointer;
            font-size: 1rem;
            margin-top: 1rem;
        }
        button:hover {
            background: #0056b3;
        }
        #result {
            margin-top: 1.5rem;
            padding: 1rem;
            background: #e9f5ff;
            border-radius: 4px;
            border: 1px solid #007bff;
            color: #007bff;
            font-weight: bold;
        }
)CSS";

// Mirrors evaluate() and RuleEngine: "yes" / "no" only, last match wins
constexpr const char* PAGE_SCRIPT = R"JS(
        const evaluateExpression = (expr, answers) => {
            if (expr.type === 'condition') {
                const answer = answers[expr.condition.variable];
                return expr.condition.negated ? answer === 'no' : answer === 'yes';
            }
            const left = evaluateExpression(expr.left, answers);
            const right = evaluateExpression(expr.right, answers);
            return expr.operator === 'AND' ? (left && right) : (left || right);
        };

        const selectResult = (answers) => {
            let selected = null;
            for (const rule of rules) {
                if (!evaluateExpression(rule.expression, answers)) continue;
                const resultVar = allResults.find(r => r.name === rule.result);
                if (resultVar) selected = resultVar.value;
            }
            return selected;
        };

        document.getElementById('ruleForm').addEventListener('submit', (e) => {
            e.preventDefault();
            const answers = {};
            new FormData(e.target).forEach((value, key) => {
                answers[key] = value;
            });

            const output = document.getElementById('result');
            const selected = selectResult(answers);
            output.textContent = selected !== null ? selected : noResultMessage;
        });
)JS";

}  // namespace

std::string html_escape(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default:   result += c;
        }
    }
    return result;
}

std::string script_safe_json(std::string_view json) {
    std::string result;
    result.reserve(json.size());
    for (size_t i = 0; i < json.size(); i++) {
        result += json[i];
        if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') {
            result += '\\';
        }
    }
    return result;
}

std::string to_html(const ParsedProgram& program, std::string_view title) {
    std::ostringstream html;
    std::string safe_title = html_escape(title);

    html << "<!DOCTYPE html>\n"
         << "<html>\n"
         << "<head>\n"
         << "    <meta charset=\"utf-8\">\n"
         << "    <title>" << safe_title << "</title>\n"
         << "    <style>" << PAGE_STYLE << "    </style>\n"
         << "</head>\n"
         << "<body>\n"
         << "    <div class=\"container\">\n"
         << "        <h1>" << safe_title << "</h1>\n"
         << "        <h2>Answer the following questions:</h2>\n"
         << "        <form id=\"ruleForm\">\n";

    for (const auto& stmt : program.statements) {
        std::string name = html_escape(stmt.name);
        html << "            <div class=\"statement\">\n"
             << "                <label>" << html_escape(stmt.value) << "</label>\n"
             << "                <div class=\"options\">\n"
             << "                    <label><input type=\"radio\" name=\"" << name
             << "\" value=\"yes\"> Yes</label>\n"
             << "                    <label><input type=\"radio\" name=\"" << name
             << "\" value=\"no\"> No</label>\n"
             << "                </div>\n"
             << "            </div>\n";
    }

    html << "            <button type=\"submit\">Diagnose</button>\n"
         << "        </form>\n"
         << "        <h2>Result:</h2>\n"
         << "        <div id=\"result\"></div>\n"
         << "    </div>\n"
         << "    <script>\n"
         << "        const rules = " << script_safe_json(rules_to_json(program.rules, 0)) << ";\n"
         << "        const allStatements = " << script_safe_json(variables_to_json(program.statements, 0)) << ";\n"
         << "        const allResults = " << script_safe_json(variables_to_json(program.results, 0)) << ";\n"
         << "        const noResultMessage = \"" << json_escape(NO_RESULT_MESSAGE) << "\";\n"
         << PAGE_SCRIPT
         << "    </script>\n"
         << "</body>\n"
         << "</html>\n";

    return html.str();
}

}  // namespace output
}  // namespace xsys
