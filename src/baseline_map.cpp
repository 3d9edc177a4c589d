#include "baseline_map.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>



static inline CorrelatorIndex correlator_index(int out1, int out2){
    CorrelatorIndex idx;
    int a, b, pa, pb;
    if(out2 > out1){
        a = out2 / 2;
        pa = out2 % 2;
        b = out1 / 2;
        pb = out1 % 2;
        idx.conjugate = true;
    }else{
        a = out1 / 2;
        pa = out1 % 2;
        b = out2 / 2;
        pb = out2 % 2;
        idx.conjugate = false;
    }
    idx.offset = 2 * a * (a + 1) + 4 * b + 2 * pb + pa;
    return idx;
}



CorrelatorIndex get_correlator_index(int out1, int out2){
    if(out1 < 0 || out1 >= N_PFB_INPUTS || out2 < 0 || out2 >= N_PFB_INPUTS){
        std::stringstream ss;
        ss << "get_correlator_index: PFB output pair (" << out1 << ", " << out2
            << ") is outside [0, " << N_PFB_INPUTS << ").";
        throw std::out_of_range(ss.str());
    }
    return correlator_index(out1, out2);
}



void get_antenna_pair_from_baseline(int baseline, int& ant1, int& ant2){
    if(baseline < 0 || baseline >= N_BASELINES){
        std::stringstream ss;
        ss << "get_antenna_pair_from_baseline: baseline " << baseline << " is outside [0, " << N_BASELINES << ").";
        throw std::out_of_range(ss.str());
    }
    // row start is N * a - a * (a + 1) / 2, solve for the largest a not exceeding baseline
    const double b {2.0 * N_ANTENNAS + 1.0};
    int a {static_cast<int>((b - std::sqrt(b * b - 8.0 * baseline)) / 2.0)};
    // correct for rounding
    while(a > 0 && get_baseline_index(a, a) > baseline) a--;
    while(a < N_ANTENNAS - 1 && get_baseline_index(a + 1, a + 1) <= baseline) a++;
    ant1 = a;
    ant2 = baseline - get_baseline_index(a, 0);
}



void generate_map(const antenna_mapping_t& ants_to_pf, const std::vector<int>& in_to_out,
        MemoryBuffer<int>& map_inds, MemoryBuffer<bool>& conj){
    if(in_to_out.size() != static_cast<size_t>(N_PFB_INPUTS)){
        std::stringstream ss;
        ss << "generate_map: 'in_to_out' must have " << N_PFB_INPUTS << " elements, got " << in_to_out.size() << ".";
        throw std::invalid_argument(ss.str());
    }
    if(map_inds.size() != static_cast<size_t>(MAP_SIZE) || conj.size() != static_cast<size_t>(MAP_SIZE)){
        std::stringstream ss;
        ss << "generate_map: output buffers must have " << MAP_SIZE << " elements, got "
            << map_inds.size() << " ('map_inds') and " << conj.size() << " ('conj').";
        throw std::invalid_argument(ss.str());
    }

    // Resolve (antenna, pol) -> PFB output once, so that the main loop is a plain array lookup.
    std::vector<int> pfb_output (N_PFB_INPUTS);
    for(int ant {0}; ant < N_ANTENNAS; ant++){
        for(int pol {0}; pol < N_POLS; pol++){
            const int pfb_input {get_pfb_input(ants_to_pf, ant, pol)};
            if(pfb_input < 0 || pfb_input >= N_PFB_INPUTS){
                std::stringstream ss;
                ss << "generate_map: PFB input " << pfb_input << " of " << antenna_pol_to_string(ant, pol)
                    << " is outside [0, " << N_PFB_INPUTS << ").";
                throw std::out_of_range(ss.str());
            }
            const int out {in_to_out[pfb_input]};
            if(out < 0 || out >= N_PFB_INPUTS){
                std::stringstream ss;
                ss << "generate_map: PFB input " << pfb_input << " is mapped to output " << out
                    << ", outside [0, " << N_PFB_INPUTS << ").";
                throw std::out_of_range(ss.str());
            }
            pfb_output[ant * N_POLS + pol] = out;
        }
    }

    int *map_data {map_inds.data()};
    bool *conj_data {conj.data()};

    #pragma omp parallel for schedule(dynamic)
    for(int ant1 = 0; ant1 < N_ANTENNAS; ant1++){
        for(int ant2 {ant1}; ant2 < N_ANTENNAS; ant2++){
            const int bls_ind {get_baseline_index(ant1, ant2)};
            for(int p1 {0}; p1 < N_POLS; p1++){
                for(int p2 {0}; p2 < N_POLS; p2++){
                    const int pol_ind {N_POLS * p1 + p2};
                    const int out1 {pfb_output[ant1 * N_POLS + p1]};
                    const int out2 {pfb_output[ant2 * N_POLS + p2]};
                    const CorrelatorIndex idx {correlator_index(out1, out2)};
                    map_data[bls_ind * N_POL_PRODUCTS + pol_ind] = idx.offset;
                    conj_data[bls_ind * N_POL_PRODUCTS + pol_ind] = idx.conjugate;
                }
            }
        }
    }
}



BaselineMap generate_map(const antenna_mapping_t& ants_to_pf, const std::vector<int>& in_to_out){
    BaselineMap map {MemoryBuffer<int> {MAP_SIZE}, MemoryBuffer<bool> {MAP_SIZE}};
    generate_map(ants_to_pf, in_to_out, map.map_inds, map.conj);
    return map;
}
