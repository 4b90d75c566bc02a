//
// Created by the shotport authors on 21/09/25.
//

#ifndef SHOTPORT_COLOR_HPP
#define SHOTPORT_COLOR_HPP

// ANSI escape sequences for console output
#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"

#endif // SHOTPORT_COLOR_HPP
