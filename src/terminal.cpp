#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  cbreak();
  echo();
  keypad(stdscr, TRUE);
}

Terminal::~Terminal() {
  endwin();
}
