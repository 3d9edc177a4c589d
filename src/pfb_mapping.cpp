#include "pfb_mapping.hpp"


const int PFB_MAPPER[PFB_BLOCK_SIZE] {
    0, 16, 32, 48, 1, 17, 33, 49, 2, 18, 34, 50, 3, 19, 35, 51,
    4, 20, 36, 52, 5, 21, 37, 53, 6, 22, 38, 54, 7, 23, 39, 55,
    8, 24, 40, 56, 9, 25, 41, 57, 10, 26, 42, 58, 11, 27, 43, 59,
    12, 28, 44, 60, 13, 29, 45, 61, 14, 30, 46, 62, 15, 31, 47, 63
};



std::vector<int> get_pfb_input_to_output_mapping(){
    std::vector<int> mapping (N_PFB_INPUTS, 0);
    
    for(int p {0}; p < N_PFB_BLOCKS; p++){
        for(int i {0}; i < PFB_BLOCK_SIZE; i++){
            mapping[PFB_MAPPER[i] + p * PFB_BLOCK_SIZE] = p * PFB_BLOCK_SIZE + i;
        }
    }
    return mapping;
}
