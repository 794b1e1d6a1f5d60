/**
 * @file main.cpp
 * @brief Entry point for MonitorGate
 */

#include <iostream>

#include "app/application.h"

int main(int argc, char* argv[]) {
  auto app = monitorgate::app::Application::Create(argc, argv);
  if (!app) {
    std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
    return 1;
  }

  return (*app)->Run();
}
