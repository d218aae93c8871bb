#pragma once
#include <iostream>
#include <string>

/**
 * @brief In-terminal progress bar for the benchmark runner, drawn on stderr.
 * @param done Units finished so far.
 * @param total Units overall; nothing is drawn when zero.
 * @param label Text printed after the bar.
 */
inline void print_progress(int done, int total, const std::string& label) {
    if (total <= 0) return;
    const int bar_width = 40;
    double progress = (double)done / total;
    if (progress > 1.0) progress = 1.0;
    if (progress < 0.0) progress = 0.0;
    int pos = (int)(bar_width * progress);

    std::cerr << "  [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] " << done << "/" << total << " " << label << "        \r";
    if (done >= total) std::cerr << "\n";
    std::cerr.flush();
}
