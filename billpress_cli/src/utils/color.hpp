//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef BILLPRESS_COLOR_HPP
#define BILLPRESS_COLOR_HPP

#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"

#endif // BILLPRESS_COLOR_HPP
