/**
 * @file action.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Действия, доступные оператору из командной строки
 */
#pragma once

#include <stdexcept>
#include <string>

enum class Action { Start, Stop, Restart };

/**
 * @class InvalidActionError
 * @brief Неизвестное действие или ошибка в аргументах командной строки
 */
class InvalidActionError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief Разобрать имя действия (без учета регистра)
 * @throw InvalidActionError Для всего, кроме start, stop, restart
 */
Action parseAction(const std::string &name);

std::string actionToString(Action action);
