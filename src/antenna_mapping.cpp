#include "antenna_mapping.hpp"
#include <sstream>
#include <stdexcept>



std::string antenna_pol_to_string(int antenna, int pol){
    std::stringstream ss;
    ss << "(antenna " << antenna << ", pol " << pol << ")";
    return ss.str();
}



antenna_mapping_t get_antenna_to_pfb_mapping(const std::vector<int>& antenna_numbers){
    if(antenna_numbers.size() != static_cast<size_t>(N_ANTENNAS)){
        std::stringstream ss;
        ss << "get_antenna_to_pfb_mapping: expected " << N_ANTENNAS << " antenna numbers, got "
            << antenna_numbers.size() << ".";
        throw std::invalid_argument(ss.str());
    }
    std::vector<bool> seen (N_ANTENNAS, false);
    antenna_mapping_t mapping;
    mapping.reserve(N_PFB_INPUTS);

    for(int i {0}; i < N_ANTENNAS; i++){
        const int ant {antenna_numbers[i]};
        if(ant < 0 || ant >= N_ANTENNAS){
            std::stringstream ss;
            ss << "get_antenna_to_pfb_mapping: antenna number " << ant << " at input pair " << i
                << " is outside [0, " << N_ANTENNAS << ").";
            throw std::out_of_range(ss.str());
        }
        if(seen[ant]){
            std::stringstream ss;
            ss << "get_antenna_to_pfb_mapping: antenna " << ant << " is connected to more than one input pair.";
            throw std::invalid_argument(ss.str());
        }
        seen[ant] = true;
        for(int p {0}; p < N_POLS; p++){
            mapping.insert({{ant, p}, N_POLS * i + p});
        }
    }
    return mapping;
}



int get_pfb_input(const antenna_mapping_t& ants_to_pf, int antenna, int pol){
    auto it = ants_to_pf.find({antenna, pol});
    if(it == ants_to_pf.end()){
        throw std::out_of_range("get_pfb_input: no PFB input for " + antenna_pol_to_string(antenna, pol) + ".");
    }
    return it->second;
}
