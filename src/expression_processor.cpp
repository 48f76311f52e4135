#include "expression_processor.hpp"

#include "converter.hpp"
#include "errors.hpp"
#include "options.hpp"

namespace intcalc {

EvaluationRecord evaluateLine(const Calculator& calculator, std::size_t lineNumber,
                              const std::string& text) {
    EvaluationRecord record;
    record.lineNumber = lineNumber;
    record.status = "error";

    // В CSV хранится тот же текст, к которому относятся позиции ошибок
    std::string expression = trim(text);
    record.expression = expression;
    if (expression.empty()) {
        record.message = "Empty line";
        return record;
    }

    try {
        auto postfix = calculator.compile(expression);
        record.postfix = toString(postfix);
        record.value = calculator.evaluate(postfix);
        record.status = "success";
    }
    catch (const SyntaxError& ex) {
        record.message = ex.what();
    }
    catch (const EvaluationError& ex) {
        record.message = ex.what();
    }
    return record;
}

} // namespace intcalc
