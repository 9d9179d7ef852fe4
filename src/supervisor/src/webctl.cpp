/*!
  \file webctl.cpp
  \author Artem Ulyanov
  \date October, 2026
  \brief Основной файл утилиты webctl.
  \details Точка входа: start, stop и restart фонового HTTP-сервера.
*/

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
    ServiceController controller;
    return controller.run(argc, argv);
}
