#pragma once

// 전략 작성 편의성용 지표 모음
#include "Indicators/Close.hpp"
#include "Indicators/Difference.hpp"
#include "Indicators/ExponentialMovingAverage.hpp"
#include "Indicators/High.hpp"
#include "Indicators/Highest.hpp"
#include "Indicators/Low.hpp"
#include "Indicators/Lowest.hpp"
#include "Indicators/MovingAverageConvergenceDivergence.hpp"
#include "Indicators/Open.hpp"
#include "Indicators/RollingMedian.hpp"
#include "Indicators/SimpleAverageTrueRange.hpp"
#include "Indicators/SimpleMovingAverage.hpp"
#include "Indicators/TrueRange.hpp"
#include "Indicators/Volume.hpp"
