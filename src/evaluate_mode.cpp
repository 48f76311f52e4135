#include "modes.hpp"

#include <ostream>

#include "calculator.hpp"
#include "converter.hpp"
#include "errors.hpp"

namespace intcalc {

int runEvaluateMode(const std::string& expression, std::ostream& out, std::ostream& err) {
    Calculator calculator;
    try {
        auto postfix = calculator.compile(expression);
        // Постфиксная запись печатается до вычисления: она корректна,
        // даже если вычисление завершится ошибкой
        out << "Postfix expression: " << toString(postfix) << "\n";
        out.flush();
        std::int64_t value = calculator.evaluate(postfix);
        out << "Evaluation:         " << value << "\n";
        return 0;
    }
    catch (const SyntaxError& ex) {
        err << ex.render() << "\n";
        return 1;
    }
    catch (const EvaluationError& ex) {
        err << "Error:              " << ex.what() << "\n";
        return 1;
    }
}

} // namespace intcalc
