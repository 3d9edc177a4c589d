#include "flagging.hpp"
#include "baseline_map.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>



std::vector<int> get_bad_ants(const std::vector<int>& flagged_antennas){
    std::vector<bool> is_flagged (N_ANTENNAS, false);
    for(int ant : flagged_antennas){
        if(ant < 0 || ant >= N_ANTENNAS){
            std::stringstream ss;
            ss << "get_bad_ants: flagged antenna " << ant << " is outside [0, " << N_ANTENNAS << ").";
            throw std::out_of_range(ss.str());
        }
        is_flagged[ant] = true;
    }

    std::vector<int> bad_baselines;
    if(flagged_antennas.empty()) return bad_baselines;

    for(int ant1 {0}; ant1 < N_ANTENNAS; ant1++){
        for(int ant2 {ant1}; ant2 < N_ANTENNAS; ant2++){
            if(is_flagged[ant1] || is_flagged[ant2])
                bad_baselines.push_back(get_baseline_index(ant1, ant2));
        }
    }
    return bad_baselines;
}



std::vector<int> get_flagged_antennas(const std::vector<int>& antenna_numbers, const std::vector<int>& flags){
    if(antenna_numbers.size() != flags.size()){
        std::stringstream ss;
        ss << "get_flagged_antennas: " << antenna_numbers.size() << " antenna numbers but "
            << flags.size() << " flags.";
        throw std::invalid_argument(ss.str());
    }
    std::vector<int> flagged;
    for(size_t i {0}; i < antenna_numbers.size(); i++){
        if(flags[i] != 0) flagged.push_back(antenna_numbers[i]);
    }
    std::sort(flagged.begin(), flagged.end());
    return flagged;
}
