/**
 * @file polling.hpp
 * @author Artem Ulyanov
 * @company STC Ltd.
 * @date October 2026
 * @brief Ограниченное по времени ожидание условия
 */
#pragma once

#include <chrono>
#include <functional>

/**
 * @brief Опрашивать условие с интервалом до истечения таймаута
 *
 * @details Условие проверяется хотя бы один раз. Число итераций не
 * превышает timeout / interval + 1 и дополнительно ограничено временем
 * по steady_clock.
 *
 * @param condition Проверяемое условие
 * @param timeout Максимальное время ожидания
 * @param interval Пауза между проверками (должна быть > 0)
 * @return true, если условие выполнилось до истечения таймаута
 */
bool pollUntil(const std::function<bool()> &condition,
               std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval);
