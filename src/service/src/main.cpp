/**
 * @file main.cpp
 * @date October 2026
 * @brief Точка входа утилиты lfs-transfer
 */

#include "../include/transfercontroller.hpp"

int main(int argc, char** argv) {
  TransferController controller;
  return controller.run(argc, argv);
}
