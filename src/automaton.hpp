#pragma once
#include <random>
#include "cell_set.hpp"

// 随机填充：清空后抽样 width*height/4 次（有放回），
// 重复坐标在集合中自然合并，所以活细胞数 <= 抽样次数
void randomize(Board& board, std::mt19937& rng);

// 计算下一代（Conway 规则，硬边界，无环绕）
// 只统计活细胞周围的坐标，代价与活细胞数成正比
void advance(Board& board);

int random_trials(const Board& board);
